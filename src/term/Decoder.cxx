// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Decoder.hxx"
#include "Error.hxx"

#include <langinfo.h>
#include <strings.h>

static constexpr std::string_view replacement_character = "\xef\xbf\xbd";

TextDecoder::TextDecoder(std::string_view _charset)
	:charset(_charset),
	 cd(iconv_open("UTF-8", charset.c_str()))
{
	if (cd == iconv_t(-1))
		throw FmtErrno(errno, "Unsupported text encoding '{}'", charset);
}

TextDecoder::~TextDecoder() noexcept
{
	iconv_close(cd);
}

std::string
TextDecoder::Decode(std::string_view src)
{
	std::string result;
	result.reserve(src.size());

	/* reset the shift state */
	iconv(cd, nullptr, nullptr, nullptr, nullptr);

	char *in = const_cast<char *>(src.data());
	std::size_t in_left = src.size();

	char buffer[1024];

	while (in_left > 0) {
		char *out = buffer;
		std::size_t out_left = sizeof(buffer);

		const std::size_t n = iconv(cd, &in, &in_left, &out, &out_left);
		result.append(buffer, out);

		if (n != std::size_t(-1))
			continue;

		switch (errno) {
		case E2BIG:
			/* output buffer full; go on with an empty one */
			break;

		case EILSEQ:
		case EINVAL:
			/* invalid or truncated sequence: skip one byte */
			result.append(replacement_character);
			++in;
			--in_left;
			iconv(cd, nullptr, nullptr, nullptr, nullptr);
			break;

		default:
			throw MakeErrno("iconv() failed");
		}
	}

	return result;
}

std::string
GetLocaleCharset()
{
	const char *codeset = nl_langinfo(CODESET);
	if (codeset == nullptr || *codeset == 0)
		return "UTF-8";

	return codeset;
}

bool
IsUTF8Charset(std::string_view charset) noexcept
{
	return charset.size() == 5
		? strncasecmp(charset.data(), "UTF-8", 5) == 0
		: (charset.size() == 4 &&
		   strncasecmp(charset.data(), "UTF8", 4) == 0);
}
