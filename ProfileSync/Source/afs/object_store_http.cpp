// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "object_store_http.h"
#include <unordered_map>
#include <psync/json.h>
#include <psync/thread.h>
#include <psync/time.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!

using namespace psync;


namespace
{
const std::chrono::seconds HTTP_SESSION_MAX_IDLE_TIME(20);
const int SIGNED_URL_EXPIRY_SEC = 3600;
const int LIST_MAX_KEYS_PER_PAGE = 1000;


std::wstring formatServerErrorRaw(std::string serverResponse)
{
    /* e.g.: { "error": "not_found", "message": "Object does not exist" }
       or merely: { "error": "invalid_token" }                             */
    serverResponse = trimCpy(serverResponse);

    if (serverResponse.empty())
        return L"<" + _("empty") + L">"; //at least give some indication

    try
    {
        const JsonValue jresponse = parseJson(serverResponse); //throw JsonParsingError

        //the message is generally more descriptive!
        if (const std::optional<std::string> message = getPrimitiveFromJsonObject(jresponse, "message"))
            return utfTo<std::wstring>(*message);

        if (const std::optional<std::string> error = getPrimitiveFromJsonObject(jresponse, "error"))
            return utfTo<std::wstring>(*error);
    }
    catch (JsonParsingError&) {} //not JSON?

    return utfTo<std::wstring>(serverResponse);
}


std::wstring formatHttpError(int statusCode, const std::string& serverResponse)
{
    if (statusCode == 401 || statusCode == 403)
        return _("Authentication failed.") + L' ' + formatHttpStatus(statusCode) + L"\n" + formatServerErrorRaw(serverResponse);

    return formatHttpStatus(statusCode) + L"\n" + formatServerErrorRaw(serverResponse);
}


JsonValue parseServerResponse(const std::string& response) //throw SysError
{
    try
    {
        return parseJson(response); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw SysError(formatJsonParsingError(e) + L"\n" + formatServerErrorRaw(response));
    }
}


std::wstring formatMissingField(const std::string& name, const JsonValue& jval)
{
    return replaceCpy<std::wstring>(L"Missing field \"%x\" in server response.", L"%x", utfTo<std::wstring>(name)) + L"\n" +
           utfTo<std::wstring>(serializeJson(jval, "" /*lineBreak*/, "" /*indent*/));
}


std::string getRequiredString(const JsonValue& jval, const std::string& name) //throw SysError
{
    if (const std::optional<std::string> val = getPrimitiveFromJsonObject(jval, name))
        return *val;
    throw SysError(formatMissingField(name, jval));
}


std::vector<PresignedUrl> parsePresignedUrls(const JsonValue& jresponse) //throw SysError
{
    const JsonValue* items = getChildFromJsonObject(jresponse, "items");
    if (!items || items->type != JsonValue::Type::array)
        throw SysError(formatMissingField("items", jresponse));

    std::vector<PresignedUrl> urls;
    for (const JsonValue& item : items->arrayVal)
        urls.push_back({getRequiredString(item, "key"), //throw SysError
                        getRequiredString(item, "url"), //
                        getPrimitiveFromJsonObject(item, "expiresAt").value_or("")});
    return urls;
}

//----------------------------------------------------------------------------------------------------------------

class HttpSessionPool //reuse (healthy) HTTP sessions: signed URLs may point to a server other than the API server
{
public:
    explicit HttpSessionPool(const Zstring& caCertFilePath) : caCertFilePath_(caCertFilePath) {}

    void access(const std::string& serverPrefix, const std::function<void(HttpSession& session)>& useHttpSession /*throw X*/) //throw SysError, X
    {
        Protected<HttpSessionCache>& sessionCache = getSessionCache(serverPrefix);

        std::unique_ptr<HttpSession> httpSession;

        sessionCache.access([&](HttpSessionCache& sessions)
        {
            while (!sessions.empty() && !httpSession)
            {
                std::unique_ptr<HttpSession> session = std::move(sessions.back());
                /**/                                            sessions.pop_back();
                if (isHealthy(*session)) //server may have timed out the connection: don't reuse
                    httpSession = std::move(session);
            }
        });

        //create new HTTP session outside the lock: one session too many is not a problem!
        if (!httpSession)
            httpSession = std::make_unique<HttpSession>(serverPrefix, caCertFilePath_); //throw SysError

        PSYNC_ON_SCOPE_EXIT(
            if (isHealthy(*httpSession))
        sessionCache.access([&](HttpSessionCache& sessions) { sessions.push_back(std::move(httpSession)); }); );

        useHttpSession(*httpSession); //throw X
    }

private:
    HttpSessionPool           (const HttpSessionPool&) = delete;
    HttpSessionPool& operator=(const HttpSessionPool&) = delete;

    static bool isHealthy(const HttpSession& s) { return std::chrono::steady_clock::now() - s.getLastUseTime() <= HTTP_SESSION_MAX_IDLE_TIME; }

    using HttpSessionCache = std::vector<std::unique_ptr<HttpSession>>;

    Protected<HttpSessionCache>& getSessionCache(const std::string& serverPrefix)
    {
        Protected<HttpSessionCache>* sessionCache = nullptr;

        sessionsByServer_.access([&](SessionsByServer& sessionsByServer)
        {
            sessionCache = &sessionsByServer[serverPrefix]; //get or create
        });
        static_assert(std::is_same_v<SessionsByServer, std::unordered_map<std::string, Protected<HttpSessionCache>>>, "require std::unordered_map so that the pointers we return remain stable");

        return *sessionCache;
    }

    using SessionsByServer = std::unordered_map<std::string, Protected<HttpSessionCache>>;

    Protected<SessionsByServer> sessionsByServer_;
    const Zstring caCertFilePath_;
};
}


std::pair<std::string, std::string> psync::splitUrl(const std::string& url) //throw SysError
{
    const size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos)
        throw SysError(replaceCpy<std::wstring>(L"Invalid URL: %x", L"%x", utfTo<std::wstring>(url)));

    const size_t pathStart = url.find_first_of("/?", schemeEnd + 3);
    if (pathStart == std::string::npos)
        return {url, "/"};

    std::string relPath = url.substr(pathStart);
    if (relPath[0] == '?')
        relPath = '/' + relPath;
    return {url.substr(0, pathStart), relPath};
}

//===========================================================================================================================

class HttpObjectStore::Impl
{
public:
    explicit Impl(const HttpStoreAccess& access) : //throw SysError
        access_(access),
        sessionPool_(access.caCertFilePath)
    {
        std::tie(apiServerPrefix_, apiBasePath_) = splitUrl(access.serverUrl); //throw SysError
        if (contains(apiBasePath_, '?'))
            throw SysError(replaceCpy<std::wstring>(L"Invalid URL: %x", L"%x", utfTo<std::wstring>(access.serverUrl)));
        if (endsWith(apiBasePath_, '/'))
            apiBasePath_.pop_back();
    }

    HttpSession::Result httpRequest(const std::string& serverPrefix, const std::string& serverRelPath, //throw SysError, X
                                    const std::vector<std::string>& extraHeaders,
                                    const std::vector<CurlOption>& extraOptions,
                                    const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/, //optional
                                    const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/) //optional
    {
        HttpSession::Result httpResult;

        sessionPool_.access(serverPrefix, [&](HttpSession& session) //throw SysError
        {
            httpResult = session.perform(serverRelPath, extraHeaders, extraOptions, writeResponse, readRequest, nullptr /*receiveHeader*/, access_.timeoutSec); //throw SysError, X
        });
        return httpResult;
    }

    //POST JSON to the object API
    JsonValue apiRequest(const std::string& operation, const JsonValue& body) //throw SysError
    {
        const std::string postBuf = serializeJson(body, "" /*lineBreak*/, "" /*indent*/);
        std::string response;

        const HttpSession::Result httpResult = httpRequest(apiServerPrefix_, apiBasePath_ + "/v1/objects/" + operation,
        {"Authorization: Bearer " + access_.token, "Content-Type: application/json"},
        {{CURLOPT_POSTFIELDS, postBuf.c_str()}, {CURLOPT_POSTFIELDSIZE_LARGE, postBuf.size()}},
        [&](std::span<const char> buf) { response.append(buf.data(), buf.size()); }, nullptr /*readRequest*/); //throw SysError

        if (httpResult.statusCode / 100 != 2)
            throw SysError(formatHttpError(httpResult.statusCode, response));

        return parseServerResponse(response); //throw SysError
    }

private:
    Impl           (const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    struct LibcurlInitCookie
    {
        LibcurlInitCookie() { libcurlInit(); }
        ~LibcurlInitCookie() { libcurlTearDown(); }
    };
    const LibcurlInitCookie curlInit_; //life time must enclose sessionPool_!

    const HttpStoreAccess access_;
    HttpSessionPool sessionPool_;

    std::string apiServerPrefix_; //e.g. "https://sync.example.com"
    std::string apiBasePath_;     //e.g. "" or "/api"
};

HttpObjectStore::HttpObjectStore(const HttpStoreAccess& access) : pimpl_(std::make_unique<Impl>(access)) {} //throw SysError
HttpObjectStore::~HttpObjectStore() {}


ObjectStat HttpObjectStore::stat(const std::string& key) //throw SysError
{
    JsonValue jbody(JsonValue::Type::object);
    jbody.objectVal["key"] = JsonValue(key);

    const JsonValue jresponse = pimpl_->apiRequest("stat", jbody); //throw SysError

    ObjectStat result;
    result.exists       = getBoolFromJsonObject(jresponse, "exists").value_or(false);
    result.lastModified = getPrimitiveFromJsonObject(jresponse, "lastModified");
    result.size         = getNumberFromJsonObject<uint64_t>(jresponse, "size");
    return result;
}


PresignedUrl HttpObjectStore::presignUpload(const std::string& key, const std::string& contentType) //throw SysError
{
    JsonValue jbody(JsonValue::Type::object);
    jbody.objectVal["key"        ] = JsonValue(key);
    jbody.objectVal["contentType"] = JsonValue(contentType);
    jbody.objectVal["expiresIn"  ] = JsonValue(SIGNED_URL_EXPIRY_SEC);

    const JsonValue jresponse = pimpl_->apiRequest("presign-upload", jbody); //throw SysError

    return {key, getRequiredString(jresponse, "url"), //throw SysError
            getPrimitiveFromJsonObject(jresponse, "expiresAt").value_or("")};
}


std::vector<PresignedUrl> HttpObjectStore::presignUploadBatch(const std::vector<std::pair<std::string, std::string>>& items) //throw SysError
{
    if (items.empty())
        return {};

    std::vector<JsonValue> jitems;
    for (const auto& [key, contentType] : items)
    {
        JsonValue jitem(JsonValue::Type::object);
        jitem.objectVal["key"        ] = JsonValue(key);
        jitem.objectVal["contentType"] = JsonValue(contentType);
        jitems.push_back(std::move(jitem));
    }

    JsonValue jbody(JsonValue::Type::object);
    jbody.objectVal["items"    ] = JsonValue(std::move(jitems));
    jbody.objectVal["expiresIn"] = JsonValue(SIGNED_URL_EXPIRY_SEC);

    const JsonValue jresponse = pimpl_->apiRequest("presign-upload-batch", jbody); //throw SysError
    return parsePresignedUrls(jresponse); //throw SysError
}


PresignedUrl HttpObjectStore::presignDownload(const std::string& key) //throw SysError
{
    JsonValue jbody(JsonValue::Type::object);
    jbody.objectVal["key"      ] = JsonValue(key);
    jbody.objectVal["expiresIn"] = JsonValue(SIGNED_URL_EXPIRY_SEC);

    const JsonValue jresponse = pimpl_->apiRequest("presign-download", jbody); //throw SysError

    return {key, getRequiredString(jresponse, "url"), //throw SysError
            getPrimitiveFromJsonObject(jresponse, "expiresAt").value_or("")};
}


std::vector<PresignedUrl> HttpObjectStore::presignDownloadBatch(const std::vector<std::string>& keys) //throw SysError
{
    if (keys.empty())
        return {};

    std::vector<JsonValue> jkeys;
    for (const std::string& key : keys)
        jkeys.emplace_back(key);

    JsonValue jbody(JsonValue::Type::object);
    jbody.objectVal["keys"     ] = JsonValue(std::move(jkeys));
    jbody.objectVal["expiresIn"] = JsonValue(SIGNED_URL_EXPIRY_SEC);

    const JsonValue jresponse = pimpl_->apiRequest("presign-download-batch", jbody); //throw SysError
    return parsePresignedUrls(jresponse); //throw SysError
}


void HttpObjectStore::uploadBytes(const std::string& url, const std::string_view bytes, const std::string& contentType) //throw SysError
{
    size_t pos = 0;
    uploadStream(url, contentType, bytes.size(), [&](std::span<char> buf)
    {
        const size_t bytesToRead = std::min(buf.size(), bytes.size() - pos);
        std::copy(bytes.begin() + pos, bytes.begin() + pos + bytesToRead, buf.data());
        pos += bytesToRead;
        return bytesToRead;
    }); //throw SysError
}


std::string HttpObjectStore::downloadBytes(const std::string& url) //throw SysError
{
    std::string bytes;
    downloadStream(url, [&](std::span<const char> buf) { bytes.append(buf.data(), buf.size()); }); //throw SysError
    return bytes;
}


void HttpObjectStore::uploadStream(const std::string& url, const std::string& contentType, uint64_t streamSize, //throw SysError, X
                                   const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/)
{
    const auto& [serverPrefix, serverRelPath] = splitUrl(url); //throw SysError

    std::string response;
    const HttpSession::Result httpResult = pimpl_->httpRequest(serverPrefix, serverRelPath,
    {"Content-Type: " + contentType},
    {{CURLOPT_INFILESIZE_LARGE, streamSize}}, //=> HTTP PUT
    [&](std::span<const char> buf) { response.append(buf.data(), buf.size()); },
    readBlock); //throw SysError, X

    if (httpResult.statusCode / 100 != 2)
        throw SysError(formatHttpError(httpResult.statusCode, response));
}


void HttpObjectStore::downloadStream(const std::string& url, const std::function<void(std::span<const char> buf)>& writeBlock /*throw X*/) //throw SysError, X
{
    const auto& [serverPrefix, serverRelPath] = splitUrl(url); //throw SysError

    std::string headBytes;
    bool headBytesWritten = false;

    const HttpSession::Result httpResult = pimpl_->httpRequest(serverPrefix, serverRelPath, {} /*extraHeaders*/, {} /*extraOptions*/,
                                                               [&](std::span<const char> buf)
    {
        if (headBytes.size() < 16 * 1024) //don't access writeBlock() yet in case of error!
            headBytes.append(buf.data(), buf.size());
        else
        {
            if (!headBytesWritten)
            {
                headBytesWritten = true;
                writeBlock(headBytes); //throw X
            }
            writeBlock(buf); //throw X
        }
    }, nullptr /*readRequest*/); //throw SysError, X

    if (httpResult.statusCode / 100 != 2)
        throw SysError(formatHttpError(httpResult.statusCode, headBytesWritten ? "" : headBytes));

    if (!headBytesWritten && !headBytes.empty())
        writeBlock(headBytes); //throw X
}


DeleteResult HttpObjectStore::deleteObject(const std::string& key, const std::optional<std::string>& tombstoneKey) //throw SysError
{
    JsonValue jbody(JsonValue::Type::object);
    jbody.objectVal["key"] = JsonValue(key);
    if (tombstoneKey)
    {
        jbody.objectVal["tombstoneKey"] = JsonValue(*tombstoneKey);
        jbody.objectVal["deletedAt"   ] = JsonValue(formatRfc3339(std::time(nullptr)));
    }

    const JsonValue jresponse = pimpl_->apiRequest("delete", jbody); //throw SysError

    return {getBoolFromJsonObject(jresponse, "deleted"         ).value_or(false),
            getBoolFromJsonObject(jresponse, "tombstoneCreated").value_or(false)};
}


DeletePrefixResult HttpObjectStore::deletePrefix(const std::string& prefix, const std::optional<std::string>& tombstoneKey) //throw SysError
{
    JsonValue jbody(JsonValue::Type::object);
    jbody.objectVal["prefix"] = JsonValue(prefix);
    if (tombstoneKey)
    {
        jbody.objectVal["tombstoneKey"] = JsonValue(*tombstoneKey);
        jbody.objectVal["deletedAt"   ] = JsonValue(formatRfc3339(std::time(nullptr)));
    }

    const JsonValue jresponse = pimpl_->apiRequest("delete-prefix", jbody); //throw SysError

    return {getNumberFromJsonObject<uint64_t>(jresponse, "deletedCount").value_or(0),
            getBoolFromJsonObject(jresponse, "tombstoneCreated").value_or(false)};
}


std::vector<ObjectInfo> HttpObjectStore::list(const std::string& prefix) //throw SysError
{
    std::vector<ObjectInfo> objects;
    std::optional<std::string> continuationToken;
    for (;;)
    {
        JsonValue jbody(JsonValue::Type::object);
        jbody.objectVal["prefix" ] = JsonValue(prefix);
        jbody.objectVal["maxKeys"] = JsonValue(LIST_MAX_KEYS_PER_PAGE);
        if (continuationToken)
            jbody.objectVal["continuationToken"] = JsonValue(*continuationToken);

        const JsonValue jresponse = pimpl_->apiRequest("list", jbody); //throw SysError

        if (const JsonValue* jobjects = getChildFromJsonObject(jresponse, "objects"))
            if (jobjects->type == JsonValue::Type::array)
                for (const JsonValue& jobject : jobjects->arrayVal)
                    objects.push_back({getRequiredString(jobject, "key"), //throw SysError
                                       getPrimitiveFromJsonObject(jobject, "lastModified").value_or(""),
                                       getNumberFromJsonObject<uint64_t>(jobject, "size").value_or(0)});

        continuationToken = getPrimitiveFromJsonObject(jresponse, "nextContinuationToken");

        if (!getBoolFromJsonObject(jresponse, "isTruncated").value_or(false) || !continuationToken || continuationToken->empty())
            return objects;
    }
}
