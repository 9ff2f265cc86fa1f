#ifndef NODEHUB_BROKER_HELPERS_CURL_H
#define NODEHUB_BROKER_HELPERS_CURL_H

#include <curl/curl.h>
#include <map>
#include <stdexcept>
#include <string>

namespace helpers
{
	/**
	 * Form parameters of a HTTP request, name to value.
	 */
	typedef std::map<std::string, std::string> curl_params;

	/**
	 * Construct url-encoded form body from given parameters.
	 * @param params source of parameters
	 * @return e.g. "status=online&name=node-1"
	 */
	std::string get_http_query(const curl_params &params);

	/**
	 * Sends POST request with curl to given url with given form parameters.
	 * @note Http basic authentication is used when username or password is non-empty.
	 * @param url address which will be requested with post
	 * @param port port of the remote server
	 * @param params body of the request will be constructed from this
	 * @param username http authentication
	 * @param passwd http authentication
	 * @return body of response from server
	 * @throws curl_exception if request was not succesfull
	 */
	std::string curl_post(const std::string &url,
		long port,
		const curl_params &params,
		const std::string &username = "",
		const std::string &passwd = "");


	/**
	 * Thrown by curl helper functions when the request cannot be completed.
	 */
	class curl_exception : public std::runtime_error
	{
	public:
		/**
		 * Constructor with further description.
		 * @param what circumstances of the failure
		 */
		explicit curl_exception(const std::string &what) : std::runtime_error(what)
		{
		}
	};
} // namespace helpers


#endif // NODEHUB_BROKER_HELPERS_CURL_H
