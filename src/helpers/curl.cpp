#include "curl.h"
#include <memory>

// Tweak for older libcurls
#ifndef CURL_HTTP_VERSION_2_0
#define CURL_HTTP_VERSION_2_0 CURL_HTTP_VERSION_1_1
#endif

typedef std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_handle;


std::string helpers::get_http_query(const curl_params &params)
{
	std::string result;
	curl_handle curl = {curl_easy_init(), curl_easy_cleanup};

	for (auto &par : params) {
		if (result.length() > 0) {
			result += "&";
		}

		std::string value = par.second;
		if (curl) {
			std::unique_ptr<char, decltype(&curl_free)> escaped = {
				curl_easy_escape(curl.get(), par.second.c_str(), static_cast<int>(par.second.length())), curl_free};
			if (escaped) {
				value = escaped.get();
			}
		}

		result += par.first + "=" + value;
	}

	return result;
}

/**
 * Wrapper function for CURL for writing result into given string.
 * @param ptr base location of result
 * @param size size of one item
 * @param nmemb number of items
 * @param str result string in which return body will be stored
 * @return length of data which were written into str
 */
static std::size_t string_write_wrapper(void *ptr, std::size_t size, std::size_t nmemb, std::string *str)
{
	std::size_t length = size * nmemb;
	str->append(static_cast<char *>(ptr), length);
	return length;
}

std::string helpers::curl_post(const std::string &url,
	long port,
	const curl_params &params,
	const std::string &username,
	const std::string &passwd)
{
	std::string result;
	std::string body = get_http_query(params);
	std::string credentials = username + ":" + passwd;

	curl_handle curl = {curl_easy_init(), curl_easy_cleanup};
	if (!curl) {
		throw curl_exception("Unable to initialize curl handle for " + url);
	}

	curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_PORT, port);
	curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());

	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, string_write_wrapper);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result);

	curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2_0);
	curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
	// responses >= 400 are errors
	curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
	// the notifier lane retries on its own, do not hang on a dead webhook
	curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 5L);
	curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 10L);
	curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

	if (!username.empty() || !passwd.empty()) {
		curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
		curl_easy_setopt(curl.get(), CURLOPT_USERPWD, credentials.c_str());
	}

	CURLcode res = curl_easy_perform(curl.get());

	if (res != CURLE_OK) {
		long response_code = 0;
		curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
		throw curl_exception("POST request failed to " + url + ". Error: (" + std::to_string(response_code) + ") " +
			curl_easy_strerror(res));
	}

	return result;
}
