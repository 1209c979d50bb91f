// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeCsrfRandom.hxx"
#include "csrf/Random.hxx"
#include "csrf/Token.hxx"
#include "csrf/TokenCodec.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>

TEST(CsrfToken, MaskUnmask)
{
	auto &random = GetDefaultCsrfRandom();

	for (unsigned i = 0; i < 10000; ++i) {
		const auto token = GenerateCsrfToken(random);
		const auto masked = MaskCsrfToken(random, token);

		const auto unmasked = UnmaskCsrfToken(masked);
		ASSERT_TRUE(unmasked);
		ASSERT_EQ(*unmasked, token);
	}
}

TEST(CsrfToken, FreshMask)
{
	FakeCsrfRandom random;
	const auto token = GenerateCsrfToken(random);

	const auto a = MaskCsrfToken(random, token);
	const auto b = MaskCsrfToken(random, token);
	EXPECT_NE(a, b);

	/* the masked token does not contain the raw token */
	EXPECT_FALSE(std::equal(token.begin(), token.end(),
				a.begin() + token.size()));

	EXPECT_EQ(UnmaskCsrfToken(a), token);
	EXPECT_EQ(UnmaskCsrfToken(b), token);
}

TEST(CsrfToken, UnmaskWrongLength)
{
	FakeCsrfRandom random;
	const auto masked = MaskCsrfToken(random, GenerateCsrfToken(random));
	const std::span<const std::byte> s{masked};

	EXPECT_FALSE(UnmaskCsrfToken({}));
	EXPECT_FALSE(UnmaskCsrfToken(s.first(s.size() - 1)));
	EXPECT_FALSE(UnmaskCsrfToken(s.first(CsrfProtect::TOKEN_LENGTH)));

	std::array<std::byte, CsrfProtect::MASKED_TOKEN_LENGTH + 1> longer{};
	EXPECT_FALSE(UnmaskCsrfToken(longer));
}

TEST(CsrfToken, Unique)
{
	auto &random = GetDefaultCsrfRandom();

	std::set<CsrfRawToken> tokens;
	for (unsigned i = 0; i < 1000; ++i)
		ASSERT_TRUE(tokens.insert(GenerateCsrfToken(random)).second);
}

TEST(CsrfToken, ConstantTimeEquals)
{
	FakeCsrfRandom random;
	const auto a = GenerateCsrfToken(random);
	auto b = a;

	EXPECT_TRUE(CsrfConstantTimeEquals(a, b));

	b.back() ^= std::byte{0x01};
	EXPECT_FALSE(CsrfConstantTimeEquals(a, b));

	b = a;
	b.front() ^= std::byte{0x80};
	EXPECT_FALSE(CsrfConstantTimeEquals(a, b));

	const std::span<const std::byte> s{a};
	EXPECT_FALSE(CsrfConstantTimeEquals(s, s.first(s.size() - 1)));
	EXPECT_FALSE(CsrfConstantTimeEquals(s.first(1), s));
	EXPECT_FALSE(CsrfConstantTimeEquals(s, {}));
	EXPECT_TRUE(CsrfConstantTimeEquals({}, {}));

	/* a prefix padded with zeroes must not match */
	const std::array<std::byte, 2> zero_prefix{};
	EXPECT_FALSE(CsrfConstantTimeEquals(zero_prefix, std::span{zero_prefix}.first(1)));
}

TEST(CsrfToken, FailingRandom)
{
	FailingCsrfRandom random;
	EXPECT_THROW(GenerateCsrfToken(random), std::runtime_error);

	const CsrfRawToken token{};
	EXPECT_THROW(MaskCsrfToken(random, token), std::runtime_error);
}

TEST(CsrfTokenCodec, Basic)
{
	FakeCsrfRandom random;
	const auto masked = MaskCsrfToken(random, GenerateCsrfToken(random));

	const auto s = EncodeCsrfToken(masked);
	EXPECT_EQ(s.size(), CsrfProtect::ENCODED_TOKEN_LENGTH);
	EXPECT_EQ(s.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZ"
				      "abcdefghijklmnopqrstuvwxyz"
				      "0123456789-_"), s.npos);

	const auto decoded = DecodeCsrfToken(s);
	ASSERT_TRUE(decoded);
	EXPECT_EQ(*decoded, masked);
}

TEST(CsrfTokenCodec, Known)
{
	CsrfMaskedToken masked{};
	EXPECT_EQ(EncodeCsrfToken(masked), std::string(86, 'A'));

	masked.fill(std::byte{0xff});
	const auto s = EncodeCsrfToken(masked);
	EXPECT_EQ(s, std::string(85, '_') + 'w');
	EXPECT_EQ(DecodeCsrfToken(s), masked);
}

TEST(CsrfTokenCodec, Malformed)
{
	FakeCsrfRandom random;
	const auto s = EncodeCsrfToken(MaskCsrfToken(random, GenerateCsrfToken(random)));

	EXPECT_FALSE(DecodeCsrfToken(""));
	EXPECT_FALSE(DecodeCsrfToken("foo"));

	/* truncated and extended */
	EXPECT_FALSE(DecodeCsrfToken(std::string_view{s}.substr(0, s.size() - 1)));
	EXPECT_FALSE(DecodeCsrfToken(s + "A"));
	EXPECT_FALSE(DecodeCsrfToken(s + "AAAA"));

	/* padding is not allowed */
	EXPECT_FALSE(DecodeCsrfToken(s + "=="));

	/* characters of the standard alphabet */
	std::string t = s;
	t[10] = '+';
	EXPECT_FALSE(DecodeCsrfToken(t));
	t[10] = '/';
	EXPECT_FALSE(DecodeCsrfToken(t));
	t[10] = ' ';
	EXPECT_FALSE(DecodeCsrfToken(t));

	/* nonzero trailing bits */
	EXPECT_FALSE(DecodeCsrfToken(std::string(85, 'A') + 'B'));
}
