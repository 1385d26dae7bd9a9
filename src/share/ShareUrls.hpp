#ifndef __TS_SHARE_URLS__
#define __TS_SHARE_URLS__

#include "Headers.hpp"

namespace ts {
/**
 * @brief Normalizes what a user typed into a share code.
 *
 * Accepts a raw code, an http(s) share URL or a custom-scheme deep link. For
 * URLs the last non-empty path segment is used; the host part of a deep link
 * is never treated as the code. Codes are 4 to 10 ASCII letters or digits and
 * are returned upper-cased.
 */
optional<string> extractShareCode(const string& codeOrUrl);

/** @brief Percent-encodes everything but RFC 3986 unreserved characters. */
string urlEncode(const string& value);

/** @brief Socket url a host uses to attach to its room. */
string buildHostSocketUrl(const string& wsEndpoint, const string& shareId,
                          const string& token);

/** @brief Socket url an observer uses; the password is only sent if set. */
string buildObserverSocketUrl(const string& wsEndpoint, const string& shareId,
                              const string& token,
                              const optional<string>& password);
}  // namespace ts

#endif  // __TS_SHARE_URLS__
