#include "storage/s3_remote_store.hpp"
#include "common/cancellation.hpp"
#include "common/checksum.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <curl/curl.h>

namespace {

size_t writeToString(void* contents, size_t size, size_t nmemb, std::string* out) {
    out->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t writeToFile(void* contents, size_t size, size_t nmemb, FILE* out) {
    return fwrite(contents, size, nmemb, out) * size;
}

size_t collectHeader(char* buffer, size_t size, size_t nitems, std::map<std::string, std::string>* headers) {
    size_t length = size * nitems;
    std::string line(buffer, length);
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        (*headers)[name] = utils::trim(line.substr(colon + 1));
    }
    return length;
}

struct UploadState {
    const std::string* data;
    FILE* file;
    uint64_t remaining;
    size_t position;
};

size_t readBody(char* buffer, size_t size, size_t nitems, UploadState* state) {
    size_t want = static_cast<size_t>(std::min<uint64_t>(size * nitems, state->remaining));
    if (want == 0) {
        return 0;
    }
    size_t got;
    if (state->data) {
        got = std::min(want, state->data->size() - state->position);
        std::copy(state->data->data() + state->position, state->data->data() + state->position + got, buffer);
        state->position += got;
    } else {
        got = fread(buffer, 1, want, state->file);
        if (got == 0) {
            return CURL_READFUNC_ABORT;
        }
    }
    state->remaining -= got;
    return got;
}

int checkCancel(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const CancellationToken* cancel = static_cast<const CancellationToken*>(clientp);
    return cancel && cancel->isCancelled() ? 1 : 0;
}

// Value of <tag>..</tag> at or after start.
std::string xmlElement(const std::string& xml, const std::string& tag, size_t start = 0, size_t end = std::string::npos) {
    std::string open = "<" + tag + ">";
    std::string close = "</" + tag + ">";
    size_t begin = xml.find(open, start);
    if (begin == std::string::npos || (end != std::string::npos && begin >= end)) {
        return "";
    }
    begin += open.size();
    size_t finish = xml.find(close, begin);
    if (finish == std::string::npos) {
        return "";
    }
    return xml.substr(begin, finish - begin);
}

std::string decodeEntities(const std::string& s) {
    static const std::pair<const char*, char> entities[] = {
        {"&lt;", '<'}, {"&gt;", '>'}, {"&amp;", '&'}, {"&quot;", '"'}, {"&apos;", '\''}};

    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        bool matched = false;
        if (s[i] == '&') {
            for (const auto& entity : entities) {
                size_t len = std::char_traits<char>::length(entity.first);
                if (s.compare(i, len, entity.first) == 0) {
                    result += entity.second;
                    i += len;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            result += s[i++];
        }
    }
    return result;
}

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

} // namespace

S3RemoteStore::S3RemoteStore(const RemoteConfig& config)
    : config_(config)
    , signer_(config.accessKey, config.secretKey, config.region) {
    static CurlGlobal curlGlobal;

    std::string endpoint = config_.endpoint;
    size_t schemeEnd = endpoint.find("://");
    if (schemeEnd == std::string::npos) {
        scheme_ = "https";
        endpointHost_ = endpoint;
    } else {
        scheme_ = endpoint.substr(0, schemeEnd);
        endpointHost_ = endpoint.substr(schemeEnd + 3);
    }
    while (!endpointHost_.empty() && endpointHost_.back() == '/') {
        endpointHost_.pop_back();
    }
    if (endpointHost_.empty() || config_.bucket.empty()) {
        throw StorageError("S3 remote '" + config_.name + "' requires endpoint and bucket");
    }
}

S3RemoteStore::~S3RemoteStore() = default;

std::string S3RemoteStore::objectKey(const std::string& path) const {
    size_t start = path.find_first_not_of('/');
    return start == std::string::npos ? "" : path.substr(start);
}

std::string S3RemoteStore::requestHost() const {
    return config_.pathStyle ? endpointHost_ : config_.bucket + "." + endpointHost_;
}

std::string S3RemoteStore::requestUri(const std::string& key) const {
    if (key.empty()) {
        return config_.pathStyle ? "/" + config_.bucket : "/";
    }
    std::string uri = config_.pathStyle ? "/" + config_.bucket + "/" : "/";
    return uri + utils::urlEncodePath(key);
}

S3RemoteStore::Response S3RemoteStore::perform(const std::string& method, const std::string& key,
                                               const std::map<std::string, std::string>& query,
                                               const Body* body, FILE* download,
                                               const CancellationToken* cancel) {
    S3Request request;
    request.method = method;
    request.canonicalUri = requestUri(key);
    request.query = query;
    request.headers["host"] = requestHost();
    if (body && body->data) {
        request.payloadHash = sha256Hex(*body->data);
    } else if (body) {
        request.payloadHash = S3Signer::unsignedPayload();
    } else {
        request.payloadHash = sha256Hex("");
    }
    std::string authorization = signer_.sign(request, std::time(nullptr));

    std::string url = scheme_ + "://" + requestHost() + request.canonicalUri;
    std::string queryString = S3Signer::canonicalQueryString(query);
    if (!queryString.empty()) {
        url += "?" + queryString;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw StorageError("Failed to initialize CURL");
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, ("Authorization: " + authorization).c_str());
    for (const auto& header : request.headers) {
        if (header.first != "host") {
            headers = curl_slist_append(headers, (header.first + ": " + header.second).c_str());
        }
    }
    // Suppress curl's default "Expect: 100-continue" on uploads.
    headers = curl_slist_append(headers, "Expect:");

    Response response;
    UploadState upload{nullptr, nullptr, 0, 0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, collectHeader);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, checkCancel);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(cancel));

    if (download) {
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeToFile);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, download);
    } else {
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeToString);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    }

    if (method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (method == "PUT") {
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    } else if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    if (body) {
        upload.data = body->data;
        upload.file = body->file;
        upload.remaining = body->data ? body->data->size() : body->length;
        if (body->file && fseeko(body->file, static_cast<off_t>(body->offset), SEEK_SET) != 0) {
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);
            throw StorageError("Failed to seek upload source");
        }
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, readBody);
        curl_easy_setopt(curl, CURLOPT_READDATA, &upload);
        if (method == "PUT") {
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(upload.remaining));
        } else {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(upload.remaining));
        }
    } else if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_off_t contentLength = -1;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);
    if (contentLength > 0) {
        response.contentLength = static_cast<uint64_t>(contentLength);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK && cancel) {
        cancel->throwIfCancelled(method + " " + key);
    }
    if (res != CURLE_OK) {
        throw StorageError(method + " " + url + " failed: " + curl_easy_strerror(res));
    }
    return response;
}

void S3RemoteStore::uploadSingle(const std::string& key, FILE* file, uint64_t size,
                                 const CancellationToken* cancel) {
    Body body;
    body.file = file;
    body.length = size;
    Response response = perform("PUT", key, {}, &body, nullptr, cancel);
    if (response.status != 200) {
        throw StorageError("PUT " + key + " returned HTTP " + std::to_string(response.status) + ": " + response.body);
    }
}

void S3RemoteStore::uploadMultipart(const std::string& key, FILE* file, uint64_t size,
                                    const CancellationToken* cancel) {
    Response initiate = perform("POST", key, {{"uploads", ""}}, nullptr, nullptr, cancel);
    std::string uploadId = xmlElement(initiate.body, "UploadId");
    if (initiate.status != 200 || uploadId.empty()) {
        throw StorageError("CreateMultipartUpload for " + key + " returned HTTP " +
                           std::to_string(initiate.status) + ": " + initiate.body);
    }
    Logger::debug("Started multipart upload " + uploadId + " for " + key);

    try {
        std::string completeXml = "<CompleteMultipartUpload>";
        int partNumber = 1;
        for (uint64_t offset = 0; offset < size; offset += config_.partSize, ++partNumber) {
            Body body;
            body.file = file;
            body.offset = offset;
            body.length = std::min<uint64_t>(config_.partSize, size - offset);

            Response part = perform("PUT", key,
                                    {{"partNumber", std::to_string(partNumber)}, {"uploadId", uploadId}},
                                    &body, nullptr, cancel);
            auto etag = part.headers.find("etag");
            if (part.status != 200 || etag == part.headers.end()) {
                throw StorageError("UploadPart " + std::to_string(partNumber) + " of " + key +
                                   " returned HTTP " + std::to_string(part.status));
            }
            completeXml += "<Part><PartNumber>" + std::to_string(partNumber) +
                           "</PartNumber><ETag>" + etag->second + "</ETag></Part>";
        }
        completeXml += "</CompleteMultipartUpload>";

        Body body;
        body.data = &completeXml;
        Response complete = perform("POST", key, {{"uploadId", uploadId}}, &body, nullptr, cancel);
        // S3 may report a failed completion inside a 200 response.
        if (complete.status != 200 || complete.body.find("<Error>") != std::string::npos) {
            throw StorageError("CompleteMultipartUpload for " + key + " returned HTTP " +
                               std::to_string(complete.status) + ": " + complete.body);
        }
    } catch (...) {
        abortMultipart(key, uploadId);
        throw;
    }
}

void S3RemoteStore::abortMultipart(const std::string& key, const std::string& uploadId) {
    try {
        Response response = perform("DELETE", key, {{"uploadId", uploadId}}, nullptr, nullptr, nullptr);
        if (response.status != 204 && response.status != 200) {
            Logger::warning("AbortMultipartUpload for " + key + " returned HTTP " + std::to_string(response.status));
        }
    } catch (const StorageError& e) {
        Logger::warning("AbortMultipartUpload for " + key + " failed: " + e.what());
    }
}

void S3RemoteStore::putFile(const std::string& path, const std::string& localFile,
                            const CancellationToken* cancel) {
    FILE* file = fopen(localFile.c_str(), "rb");
    if (!file) {
        throw StorageError("Cannot open " + localFile);
    }
    std::unique_ptr<FILE, int (*)(FILE*)> guard(file, fclose);

    if (fseeko(file, 0, SEEK_END) != 0) {
        throw StorageError("Cannot size " + localFile);
    }
    uint64_t size = static_cast<uint64_t>(ftello(file));

    std::string key = objectKey(path);
    if (size > config_.multipartThreshold) {
        uploadMultipart(key, file, size, cancel);
    } else {
        uploadSingle(key, file, size, cancel);
    }
    Logger::debug("Uploaded " + key + " (" + std::to_string(size) + " bytes) to " + name());
}

void S3RemoteStore::putObject(const std::string& path, const std::string& content) {
    Body body;
    body.data = &content;
    std::string key = objectKey(path);
    Response response = perform("PUT", key, {}, &body, nullptr, nullptr);
    if (response.status != 200) {
        throw StorageError("PUT " + key + " returned HTTP " + std::to_string(response.status) + ": " + response.body);
    }
}

void S3RemoteStore::getFile(const std::string& path, const std::string& localFile,
                            const CancellationToken* cancel) {
    FILE* file = fopen(localFile.c_str(), "wb");
    if (!file) {
        throw StorageError("Cannot create " + localFile);
    }
    std::unique_ptr<FILE, int (*)(FILE*)> guard(file, fclose);

    std::string key = objectKey(path);
    Response response = perform("GET", key, {}, nullptr, file, cancel);
    if (response.status != 200) {
        throw StorageError("GET " + key + " returned HTTP " + std::to_string(response.status));
    }
    if (fflush(file) != 0) {
        throw StorageError("Failed to write " + localFile);
    }
}

std::string S3RemoteStore::getObject(const std::string& path) {
    std::string key = objectKey(path);
    Response response = perform("GET", key, {}, nullptr, nullptr, nullptr);
    if (response.status != 200) {
        throw StorageError("GET " + key + " returned HTTP " + std::to_string(response.status));
    }
    return response.body;
}

S3RemoteStore::ListPage S3RemoteStore::parseListResponse(const std::string& xml) {
    ListPage page;
    page.truncated = xmlElement(xml, "IsTruncated") == "true";
    page.continuationToken = decodeEntities(xmlElement(xml, "NextContinuationToken"));

    const std::string open = "<Contents>";
    const std::string close = "</Contents>";
    size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        size_t end = xml.find(close, pos);
        if (end == std::string::npos) {
            throw StorageError("Malformed ListObjectsV2 response");
        }
        RemoteObject object;
        object.name = decodeEntities(xmlElement(xml, "Key", pos, end));
        std::string size = xmlElement(xml, "Size", pos, end);
        try {
            object.size = size.empty() ? 0 : std::stoull(size);
        } catch (const std::exception&) {
            throw StorageError("Malformed object size in listing: " + size);
        }
        page.objects.push_back(object);
        pos = end + close.size();
    }
    return page;
}

std::vector<RemoteObject> S3RemoteStore::list(const std::string& directory) {
    std::string prefix = objectKey(directory);
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }

    std::vector<RemoteObject> objects;
    std::string token;
    do {
        std::map<std::string, std::string> query = {
            {"list-type", "2"}, {"prefix", prefix}, {"delimiter", "/"}};
        if (!token.empty()) {
            query["continuation-token"] = token;
        }

        Response response = perform("GET", "", query, nullptr, nullptr, nullptr);
        if (response.status != 200) {
            throw StorageError("ListObjectsV2 " + prefix + " returned HTTP " + std::to_string(response.status));
        }

        ListPage page = parseListResponse(response.body);
        for (auto& object : page.objects) {
            if (object.name.compare(0, prefix.size(), prefix) == 0) {
                object.name = object.name.substr(prefix.size());
                objects.push_back(object);
            }
        }
        token = page.truncated ? page.continuationToken : "";
    } while (!token.empty());

    return objects;
}

std::optional<uint64_t> S3RemoteStore::objectSize(const std::string& path) {
    Response response = perform("HEAD", objectKey(path), {}, nullptr, nullptr, nullptr);
    if (response.status == 404) {
        return std::nullopt;
    }
    if (response.status != 200) {
        throw StorageError("HEAD " + path + " returned HTTP " + std::to_string(response.status));
    }
    return response.contentLength;
}

void S3RemoteStore::remove(const std::string& path) {
    std::string key = objectKey(path);
    Response response = perform("DELETE", key, {}, nullptr, nullptr, nullptr);
    if (response.status != 204 && response.status != 200) {
        throw StorageError("DELETE " + key + " returned HTTP " + std::to_string(response.status));
    }
}
