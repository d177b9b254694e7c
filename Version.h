// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_VERSION_H
#define COMICDEX_VERSION_H

#include <string_view>

namespace Version {
    inline constexpr std::string_view VERSION = "0.4.0";

    // Bumped whenever the D-Bus surface of comicdexd changes incompatibly.
    inline constexpr unsigned API_VERSION = 1;
};

#endif //COMICDEX_VERSION_H
