// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

#include <iconv.h>

/**
 * Converts byte strings in a configurable character set to UTF-8.
 * Invalid input is replaced with U+FFFD.
 */
class TextDecoder {
	const std::string charset;

	iconv_t cd;

public:
	/**
	 * Throws if the character set is not supported.
	 */
	explicit TextDecoder(std::string_view _charset);
	~TextDecoder() noexcept;

	TextDecoder(const TextDecoder &) = delete;
	TextDecoder &operator=(const TextDecoder &) = delete;

	const std::string &GetCharset() const noexcept {
		return charset;
	}

	std::string Decode(std::string_view src);
};

/**
 * Determine the character set of the current locale (LC_CTYPE),
 * falling back to "UTF-8".
 */
std::string
GetLocaleCharset();

/**
 * Does the given character set name refer to UTF-8?
 */
[[gnu::pure]]
bool
IsUTF8Charset(std::string_view charset) noexcept;
