#pragma once

#include <string>
#include <curl/curl.h>

namespace utils {

inline std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return str;
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    std::string result(encoded ? encoded : "");
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

// Object keys keep their '/' separators in request paths.
inline std::string urlEncodePath(const std::string& path) {
    std::string result;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        result += urlEncode(path.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos) {
            break;
        }
        result += '/';
        start = slash + 1;
    }
    return result;
}

inline std::string trim(const std::string& str) {
    size_t begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}

inline std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

} // namespace utils
