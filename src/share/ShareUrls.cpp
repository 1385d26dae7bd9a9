#include "ShareUrls.hpp"

namespace ts {
namespace {
bool isValidCode(const string& code) {
  if (code.length() < 4 || code.length() > 10) {
    return false;
  }
  for (char c : code) {
    if (!isalnum((unsigned char)c)) {
      return false;
    }
  }
  return true;
}

string toUpper(string s) {
  transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return char(toupper(c)); });
  return s;
}

string trim(const string& s) {
  const char* whitespace = " \t\r\n\v\f";
  size_t first = s.find_first_not_of(whitespace);
  if (first == string::npos) {
    return "";
  }
  size_t last = s.find_last_not_of(whitespace);
  return s.substr(first, last - first + 1);
}

// Length of a leading "scheme://" or 0.
size_t schemePrefixLength(const string& s) {
  size_t sep = s.find("://");
  if (sep == string::npos || sep == 0 || !isalpha((unsigned char)s[0])) {
    return 0;
  }
  for (size_t i = 1; i < sep; i++) {
    char c = s[i];
    if (!isalnum((unsigned char)c) && c != '+' && c != '-' && c != '.') {
      return 0;
    }
  }
  return sep + 3;
}

string appendQuery(const string& endpoint,
                   const vector<pair<string, string>>& params) {
  string url = endpoint;
  char separator = endpoint.find('?') == string::npos ? '?' : '&';
  for (const auto& it : params) {
    url.push_back(separator);
    url += urlEncode(it.first) + "=" + urlEncode(it.second);
    separator = '&';
  }
  return url;
}
}  // namespace

optional<string> extractShareCode(const string& codeOrUrl) {
  string trimmed = trim(codeOrUrl);
  if (trimmed.empty()) {
    return nullopt;
  }

  size_t prefix = schemePrefixLength(trimmed);
  if (prefix > 0) {
    string rest = trimmed.substr(prefix);
    rest = rest.substr(0, rest.find_first_of("?#"));
    size_t pathStart = rest.find('/');
    if (pathStart == string::npos) {
      return nullopt;
    }
    string lastSegment;
    stringstream path(rest.substr(pathStart));
    string segment;
    while (getline(path, segment, '/')) {
      if (!segment.empty()) {
        lastSegment = segment;
      }
    }
    if (!isValidCode(lastSegment)) {
      return nullopt;
    }
    return toUpper(lastSegment);
  }

  if (!isValidCode(trimmed)) {
    return nullopt;
  }
  return toUpper(trimmed);
}

string urlEncode(const string& value) {
  ostringstream escaped;
  escaped.fill('0');
  escaped << hex << uppercase;
  for (unsigned char c : value) {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped << c;
    } else {
      escaped << '%' << setw(2) << int(c);
    }
  }
  return escaped.str();
}

string buildHostSocketUrl(const string& wsEndpoint, const string& shareId,
                          const string& token) {
  return appendQuery(wsEndpoint,
                     {{"share_id", shareId}, {"role", "host"}, {"token", token}});
}

string buildObserverSocketUrl(const string& wsEndpoint, const string& shareId,
                              const string& token,
                              const optional<string>& password) {
  vector<pair<string, string>> params = {
      {"share_id", shareId}, {"role", "observer"}, {"token", token}};
  if (password && !password->empty()) {
    params.push_back({"password", *password});
  }
  return appendQuery(wsEndpoint, params);
}
}  // namespace ts
