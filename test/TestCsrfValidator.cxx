// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeCsrfRandom.hxx"
#include "RecordingHttpRequest.hxx"
#include "csrf/Config.hxx"
#include "csrf/Context.hxx"
#include "csrf/TokenCodec.hxx"
#include "csrf/Validator.hxx"
#include "lib/sodium/Base64.hxx"

#include <gtest/gtest.h>

#include <algorithm>

namespace {

struct CsrfValidatorTest : testing::Test {
	FakeCsrfRandom random;
	const CsrfConfig config{};
	const CsrfRawToken token = GenerateCsrfToken(random);

	std::string Mask(const CsrfRawToken &t) {
		return EncodeCsrfToken(MaskCsrfToken(random, t));
	}
};

} // anonymous namespace

TEST_F(CsrfValidatorTest, SafeMethods)
{
	for (const auto method : {HttpMethod::GET, HttpMethod::HEAD,
				  HttpMethod::OPTIONS, HttpMethod::TRACE}) {
		RecordingHttpRequest request{method};
		EXPECT_EQ(ValidateCsrfRequest(config, request, token),
			  CsrfFailure::NONE);
	}
}

TEST_F(CsrfValidatorTest, UnsafeMethods)
{
	for (const auto method : {HttpMethod::POST, HttpMethod::PUT,
				  HttpMethod::DELETE, HttpMethod::PATCH}) {
		RecordingHttpRequest request{method};
		EXPECT_EQ(ValidateCsrfRequest(config, request, token),
			  CsrfFailure::NO_TOKEN);
	}
}

TEST_F(CsrfValidatorTest, CustomSafeMethods)
{
	CsrfConfig c;
	c.safe_methods = {HttpMethod::GET, HttpMethod::PROPFIND};

	RecordingHttpRequest propfind{HttpMethod::PROPFIND};
	EXPECT_EQ(ValidateCsrfRequest(c, propfind, token), CsrfFailure::NONE);

	RecordingHttpRequest head{HttpMethod::HEAD};
	EXPECT_EQ(ValidateCsrfRequest(c, head, token), CsrfFailure::NO_TOKEN);
}

TEST_F(CsrfValidatorTest, SkipCheck)
{
	RecordingHttpRequest request{HttpMethod::POST};
	CsrfUnsafeSkipCheck(request);
	EXPECT_EQ(ValidateCsrfRequest(config, request, token), CsrfFailure::NONE);
}

TEST_F(CsrfValidatorTest, Header)
{
	RecordingHttpRequest request{HttpMethod::POST};
	request.headers.Add("x-csrf-token", Mask(token));
	EXPECT_EQ(ValidateCsrfRequest(config, request, token), CsrfFailure::NONE);
}

TEST_F(CsrfValidatorTest, CustomHeader)
{
	CsrfConfig c;
	c.request_header = "X-Token";

	RecordingHttpRequest request{HttpMethod::POST};
	request.headers.Add("X-CSRF-Token", Mask(token));
	EXPECT_EQ(ValidateCsrfRequest(c, request, token), CsrfFailure::NO_TOKEN);

	request.headers.Add("X-Token", Mask(token));
	EXPECT_EQ(ValidateCsrfRequest(c, request, token), CsrfFailure::NONE);
}

TEST_F(CsrfValidatorTest, FormField)
{
	RecordingHttpRequest request{HttpMethod::POST};
	request.SetFormBody("a=b&csrfToken=" + Mask(token) + "&c=d");
	EXPECT_EQ(ValidateCsrfRequest(config, request, token), CsrfFailure::NONE);
}

TEST_F(CsrfValidatorTest, FormFieldWrongContentType)
{
	RecordingHttpRequest request{HttpMethod::POST};
	request.SetFormBody("csrfToken=" + Mask(token));
	request.headers.Set("content-type", "text/plain");
	EXPECT_EQ(ValidateCsrfRequest(config, request, token), CsrfFailure::NO_TOKEN);
}

TEST_F(CsrfValidatorTest, HeaderBeforeField)
{
	const auto other = GenerateCsrfToken(random);

	RecordingHttpRequest request{HttpMethod::POST};
	request.SetFormBody("csrfToken=" + Mask(token));
	request.headers.Add("x-csrf-token", Mask(other));
	EXPECT_EQ(ValidateCsrfRequest(config, request, token),
		  CsrfFailure::TOKEN_MISMATCH);
	EXPECT_EQ(ValidateCsrfRequest(config, request, other),
		  CsrfFailure::NONE);
}

TEST_F(CsrfValidatorTest, EmptyHeaderFallsBack)
{
	RecordingHttpRequest request{HttpMethod::POST};
	request.headers.Add("x-csrf-token", "");
	request.SetFormBody("csrfToken=" + Mask(token));
	EXPECT_EQ(ValidateCsrfRequest(config, request, token), CsrfFailure::NONE);
}

TEST_F(CsrfValidatorTest, QueryStringIgnored)
{
	RecordingHttpRequest request{HttpMethod::POST, "/submit?csrfToken=" + Mask(token)};
	EXPECT_EQ(ValidateCsrfRequest(config, request, token), CsrfFailure::NO_TOKEN);
}

TEST_F(CsrfValidatorTest, Malformed)
{
	RecordingHttpRequest request{HttpMethod::POST};
	request.headers.Add("x-csrf-token", "not-a-token");
	EXPECT_EQ(ValidateCsrfRequest(config, request, token),
		  CsrfFailure::MALFORMED_TOKEN);
}

TEST_F(CsrfValidatorTest, Unmasked)
{
	/* submitting the raw token (without mask) is not accepted */
	RecordingHttpRequest request{HttpMethod::POST};
	request.headers.Add("x-csrf-token", UrlSafeBase64(token));
	EXPECT_EQ(ValidateCsrfRequest(config, request, token),
		  CsrfFailure::MALFORMED_TOKEN);
}

TEST_F(CsrfValidatorTest, ZeroMask)
{
	/* a zero pad is just a mask like any other */
	CsrfMaskedToken masked{};
	std::copy(token.begin(), token.end(), masked.begin() + token.size());

	RecordingHttpRequest request{HttpMethod::POST};
	request.headers.Add("x-csrf-token", EncodeCsrfToken(masked));
	EXPECT_EQ(ValidateCsrfRequest(config, request, token), CsrfFailure::NONE);

	request.headers.Set("x-csrf-token", EncodeCsrfToken(CsrfMaskedToken{}));
	EXPECT_EQ(ValidateCsrfRequest(config, request, token),
		  CsrfFailure::TOKEN_MISMATCH);
}

TEST_F(CsrfValidatorTest, Mismatch)
{
	RecordingHttpRequest request{HttpMethod::POST};
	request.headers.Add("x-csrf-token", Mask(GenerateCsrfToken(random)));
	EXPECT_EQ(ValidateCsrfRequest(config, request, token),
		  CsrfFailure::TOKEN_MISMATCH);
}

TEST_F(CsrfValidatorTest, FailureReason)
{
	EXPECT_TRUE(GetCsrfFailureReason(CsrfFailure::NONE).empty());
	EXPECT_EQ(GetCsrfFailureReason(CsrfFailure::NO_TOKEN),
		  "CSRF token not found in request");
	EXPECT_EQ(GetCsrfFailureReason(CsrfFailure::MALFORMED_TOKEN),
		  "CSRF token is malformed");
	EXPECT_EQ(GetCsrfFailureReason(CsrfFailure::TOKEN_MISMATCH),
		  "CSRF token invalid");
}
