// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeCsrfRandom.hxx"
#include "RecordingHttpRequest.hxx"
#include "csrf/CookieStore.hxx"
#include "csrf/TokenCodec.hxx"
#include "http/CommonHeaders.hxx"
#include "util/StringSplit.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

namespace {

struct CookieStoreTest : testing::Test {
	FakeCsrfRandom random;
	const CsrfAuthKey key = CsrfAuthKey::Generate(random);

	std::chrono::system_clock::time_point now{std::chrono::seconds{1700000000}};

	CookieCsrfTokenStore::Clock clock = [this]{ return now; };

	/**
	 * Let #store issue a cookie for the given token and return
	 * the cookie value.
	 */
	static std::string Issue(CsrfTokenStore &store, const CsrfRawToken &token) {
		RecordingHttpRequest request{HttpMethod::GET};
		store.Save(request, token);

		const auto set_cookie = request.response_headers.Get(set_cookie_header);
		const auto [name_value, attributes] = Split(set_cookie, ';');
		const auto [name, value] = Split(name_value, '=');
		return std::string{value};
	}

	static std::optional<CsrfRawToken> Submit(const CsrfTokenStore &store,
						  std::string_view cookie) {
		RecordingHttpRequest request{HttpMethod::POST};
		request.headers.Add(cookie_header, cookie);
		return store.Load(request);
	}

	static std::optional<CsrfRawToken> Submit(const CsrfTokenStore &store,
						  std::string_view name,
						  std::string_view value) {
		return Submit(store, std::string{name} + "=" + std::string{value});
	}
};

} // anonymous namespace

TEST_F(CookieStoreTest, SaveLoad)
{
	CookieCsrfTokenStore store{CsrfConfig{}, key, random, clock};

	const auto token = store.New();
	const auto value = Issue(store, token);

	EXPECT_EQ(Submit(store, "_csrf", value), token);

	/* other cookies are ignored */
	EXPECT_EQ(Submit(store, "a=b; _csrf=" + value + "; c=d"), token);
}

TEST_F(CookieStoreTest, Fresh)
{
	CookieCsrfTokenStore store{CsrfConfig{}, key, random, clock};

	const auto token = store.New();
	const auto a = Issue(store, token);
	const auto b = Issue(store, token);
	EXPECT_NE(a, b);
	EXPECT_EQ(Submit(store, "_csrf", a), token);
	EXPECT_EQ(Submit(store, "_csrf", b), token);
}

TEST_F(CookieStoreTest, Missing)
{
	CookieCsrfTokenStore store{CsrfConfig{}, key, random, clock};

	RecordingHttpRequest request{HttpMethod::GET};
	EXPECT_FALSE(store.Load(request));

	EXPECT_FALSE(Submit(store, "foo=bar"));
	EXPECT_FALSE(Submit(store, "_csrf", ""));
}

TEST_F(CookieStoreTest, Malformed)
{
	CookieCsrfTokenStore store{CsrfConfig{}, key, random, clock};

	const auto value = Issue(store, store.New());
	const auto [token, signature] = Split(value, '.');
	ASSERT_NE(signature.data(), nullptr);

	EXPECT_FALSE(Submit(store, "_csrf", "garbage"));
	EXPECT_FALSE(Submit(store, "_csrf", token));
	EXPECT_FALSE(Submit(store, "_csrf", std::string{token} + "."));
	EXPECT_FALSE(Submit(store, "_csrf", "." + std::string{signature}));
	EXPECT_FALSE(Submit(store, "_csrf", std::string{token} + ".!!"));
	EXPECT_FALSE(Submit(store, "_csrf", value + "A"));
}

TEST_F(CookieStoreTest, Tampered)
{
	CookieCsrfTokenStore store{CsrfConfig{}, key, random, clock};

	const auto token = store.New();
	const auto value = Issue(store, token);

	/* flip one character in each position */
	for (std::size_t i = 0; i < value.size(); ++i) {
		if (value[i] == '.')
			continue;

		std::string t = value;
		t[i] = t[i] == 'A' ? 'B' : 'A';
		EXPECT_FALSE(Submit(store, "_csrf", t)) << "position " << i;
	}
}

TEST_F(CookieStoreTest, WrongKey)
{
	CookieCsrfTokenStore store{CsrfConfig{}, key, random, clock};
	CookieCsrfTokenStore other{CsrfConfig{}, CsrfAuthKey::Generate(random), random, clock};

	const auto value = Issue(other, other.New());
	EXPECT_FALSE(Submit(store, "_csrf", value));
}

TEST_F(CookieStoreTest, WrongCookieName)
{
	CsrfConfig config;
	config.cookie_name = "other";

	CookieCsrfTokenStore store{CsrfConfig{}, key, random, clock};
	CookieCsrfTokenStore other{config, key, random, clock};

	/* a value moved to another cookie name is rejected */
	const auto value = Issue(other, other.New());
	EXPECT_TRUE(Submit(other, "other", value));
	EXPECT_FALSE(Submit(store, "_csrf", value));
}

TEST_F(CookieStoreTest, Expiry)
{
	CsrfConfig config;
	config.max_age = std::chrono::hours{1};

	CookieCsrfTokenStore store{config, key, random, clock};

	const auto token = store.New();
	const auto value = Issue(store, token);

	now += std::chrono::minutes{59};
	EXPECT_EQ(Submit(store, "_csrf", value), token);

	now += std::chrono::minutes{1};
	EXPECT_EQ(Submit(store, "_csrf", value), token);

	now += std::chrono::seconds{1};
	EXPECT_FALSE(Submit(store, "_csrf", value));
}

TEST_F(CookieStoreTest, NoExpiry)
{
	CsrfConfig config;
	config.max_age = {};

	CookieCsrfTokenStore store{config, key, random, clock};

	const auto token = store.New();
	const auto value = Issue(store, token);

	now += std::chrono::hours{24 * 365};
	EXPECT_EQ(Submit(store, "_csrf", value), token);
}

TEST_F(CookieStoreTest, Future)
{
	CookieCsrfTokenStore store{CsrfConfig{}, key, random, clock};

	const auto token = store.New();
	const auto value = Issue(store, token);

	/* tolerate some clock skew */
	now -= std::chrono::seconds{60};
	EXPECT_EQ(Submit(store, "_csrf", value), token);

	now -= std::chrono::seconds{1};
	EXPECT_FALSE(Submit(store, "_csrf", value));
}

TEST_F(CookieStoreTest, Attributes)
{
	auto config = MakeCsrfConfig({
		CsrfPath("/app"),
		CsrfDomain("example.com"),
		CsrfMaxAge(std::chrono::seconds{600}),
		CsrfSameSite(CookieSameSite::STRICT),
	});

	CookieCsrfTokenStore store{config, key, random, clock};

	RecordingHttpRequest request{HttpMethod::GET};
	store.Save(request, store.New());

	const auto set_cookie = request.response_headers.Get(set_cookie_header);
	EXPECT_TRUE(set_cookie.starts_with("_csrf="));
	EXPECT_NE(set_cookie.find("; Path=/app"), set_cookie.npos);
	EXPECT_NE(set_cookie.find("; Domain=example.com"), set_cookie.npos);
	EXPECT_NE(set_cookie.find("; Max-Age=600"), set_cookie.npos);
	EXPECT_NE(set_cookie.find("; Secure"), set_cookie.npos);
	EXPECT_NE(set_cookie.find("; HttpOnly"), set_cookie.npos);
	EXPECT_NE(set_cookie.find("; SameSite=Strict"), set_cookie.npos);
}

TEST_F(CookieStoreTest, SessionCookie)
{
	auto config = MakeCsrfConfig({
		CsrfMaxAge({}),
		CsrfSecure(false),
		CsrfHttpOnly(false),
	});

	CookieCsrfTokenStore store{config, key, random, clock};

	RecordingHttpRequest request{HttpMethod::GET};
	store.Save(request, store.New());

	const auto set_cookie = request.response_headers.Get(set_cookie_header);
	EXPECT_EQ(set_cookie.find("Max-Age"), set_cookie.npos);
	EXPECT_EQ(set_cookie.find("Secure"), set_cookie.npos);
	EXPECT_EQ(set_cookie.find("HttpOnly"), set_cookie.npos);
	EXPECT_EQ(set_cookie.find("Path"), set_cookie.npos);
	EXPECT_EQ(set_cookie.find("SameSite"), set_cookie.npos);
}

TEST_F(CookieStoreTest, DeleteCookie)
{
	CookieCsrfTokenStore store{MakeCsrfConfig({CsrfMaxAge(std::chrono::seconds{-1})}),
				   key, random, clock};

	RecordingHttpRequest request{HttpMethod::GET};
	store.Save(request, store.New());

	const auto set_cookie = request.response_headers.Get(set_cookie_header);
	EXPECT_NE(set_cookie.find("; Max-Age=0"), set_cookie.npos);
}

TEST_F(CookieStoreTest, FailingRandom)
{
	FailingCsrfRandom failing;
	CookieCsrfTokenStore store{CsrfConfig{}, key, failing, clock};

	EXPECT_THROW(store.New(), std::runtime_error);

	RecordingHttpRequest request{HttpMethod::GET};
	EXPECT_THROW(store.Save(request, CsrfRawToken{}), std::runtime_error);
	EXPECT_FALSE(request.response_headers.Contains(set_cookie_header));
}
