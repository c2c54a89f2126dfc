// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_BIP39_WORDLIST_H
#define CERTENVAULT_BIP39_WORDLIST_H

#include <array>
#include <cstddef>
#include <string_view>

namespace CertenVault {

inline constexpr size_t BIP39_WORD_COUNT = 2048;

extern const std::array<std::string_view, BIP39_WORD_COUNT> BIP39_ENGLISH_WORDLIST;

}  // namespace CertenVault

#endif  // CERTENVAULT_BIP39_WORDLIST_H
