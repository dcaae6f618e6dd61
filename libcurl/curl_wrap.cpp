// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "curl_wrap.h"
#include <psync/open_ssl.h>
#include <psync/extra_log.h>
#include <atomic>
#include <fcntl.h>

using namespace psync;


namespace
{
std::atomic<int> curlInitLevel{0}; //support interleaving initialization calls!
}

void psync::libcurlInit()
{
    if (++curlInitLevel != 1)
        return;

    openSslInit();

    try
    {
        ASSERT_SYSERROR(::curl_global_init(CURL_GLOBAL_NOTHING /*OpenSSL is initialized by us*/) == CURLE_OK);
    }
    catch (const SysError& e) { logExtraError(_("Error during process initialization.") + L"\n\n" + e.toString()); }
}


void psync::libcurlTearDown()
{
    if (--curlInitLevel != 0)
        return;

    ::curl_global_cleanup();
    openSslTearDown();
}


HttpSession::HttpSession(const std::string& serverPrefix, const Zstring& caCertFilePath) : //throw SysError
    serverPrefix_(serverPrefix),
    caCertFilePath_(utfTo<std::string>(caCertFilePath))
{
    if (!startsWith(serverPrefix_, "http://") &&
        !startsWith(serverPrefix_, "https://"))
        throw SysError(replaceCpy<std::wstring>(L"Unsupported URL scheme: %x", L"%x", utfTo<std::wstring>(serverPrefix_)));
}


HttpSession::~HttpSession()
{
    if (easyHandle_)
        ::curl_easy_cleanup(easyHandle_);
}


HttpSession::Result HttpSession::perform(const std::string& serverRelPath,
                                         const std::vector<std::string>& extraHeaders, const std::vector<CurlOption>& extraOptions,
                                         const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/, //optional
                                         const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/, //optional; return "bytesToRead" bytes unless end of stream!
                                         const std::function<void(const std::string_view& header)>& receiveHeader /*throw X*/, //optional
                                         int timeoutSec) //throw SysError, X
{
    if (!easyHandle_)
    {
        easyHandle_ = ::curl_easy_init();
        if (!easyHandle_)
            throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
    }
    else
        ::curl_easy_reset(easyHandle_);

    auto setCurlOption = [easyHandle = easyHandle_](const CurlOption& curlOpt) //throw SysError
    {
        if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
            rc != CURLE_OK)
            throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                             formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
    };

    char curlErrorBuf[CURL_ERROR_SIZE] = {};
    setCurlOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

    setCurlOption({CURLOPT_USERAGENT, "ProfileSync"}); //throw SysError
    //default value; may be overwritten by caller

    const std::string url = serverPrefix_ + serverRelPath;
    setCurlOption({CURLOPT_URL, url.c_str()}); //throw SysError

    setCurlOption({CURLOPT_NOSIGNAL, 1}); //throw SysError
    //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html

    setCurlOption({CURLOPT_CONNECTTIMEOUT, timeoutSec}); //throw SysError

    //CURLOPT_TIMEOUT puts a hard limit on the whole transfer => useless for large files
    setCurlOption({CURLOPT_LOW_SPEED_TIME, timeoutSec}); //throw SysError
    setCurlOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError
    //can't use "0" which means "inactive", so use some low number

    std::exception_ptr userCallbackException;

    //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
    auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
    {
        if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1)
        {
            userCallbackException = std::make_exception_ptr(SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno)));
            return CURL_SOCKOPT_ERROR;
        }
        return CURL_SOCKOPT_OK;
    };

    using SocketCbType = decltype(onSocketCreate);
    using SocketCbWrapperType = int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
    SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
    {
        return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
    };

    setCurlOption({CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
    setCurlOption({CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

    if (caCertFilePath_.empty())
    {
        setCurlOption({CURLOPT_CAINFO, 0}); //throw SysError
        setCurlOption({CURLOPT_SSL_VERIFYPEER, 0}); //throw SysError
        setCurlOption({CURLOPT_SSL_VERIFYHOST, 0}); //throw SysError
    }
    else
        setCurlOption({CURLOPT_CAINFO, caCertFilePath_.c_str()}); //throw SysError
    //CURLOPT_SSL_VERIFYPEER, CURLOPT_SSL_VERIFYHOST => already active by default

    //---------------------------------------------------
    auto onHeaderReceived = [&](const char* buffer, size_t len)
    {
        try
        {
            receiveHeader({buffer, len}); //throw X
            return len;
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return len + 1; //signal error condition => CURLE_WRITE_ERROR
        }
    };
    curl_write_callback onHeaderReceivedWrapper = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(onHeaderReceived)*>(callbackData))(buffer, size * nitems);
    };
    //---------------------------------------------------
    auto onBytesReceived = [&](const char* buffer, size_t bytesToWrite)
    {
        try
        {
            writeResponse({buffer, bytesToWrite}); //throw X
            return bytesToWrite;
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
        }
    };
    curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems);
    };
    //---------------------------------------------------
    auto getBytesToSend = [&](char* buffer, size_t bytesToRead) -> size_t
    {
        try
        {
            /*  libcurl calls back until 0 bytes are returned (Posix read() semantics), or,
                if CURLOPT_INFILESIZE_LARGE was set, after exactly this amount of bytes     */
            return readRequest({buffer, bytesToRead}); //throw X; return "bytesToRead" bytes unless end of stream
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
        }
    };
    curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems);
    };
    //---------------------------------------------------
    if (receiveHeader)
    {
        setCurlOption({CURLOPT_HEADERDATA, &onHeaderReceived}); //throw SysError
        setCurlOption({CURLOPT_HEADERFUNCTION, onHeaderReceivedWrapper}); //throw SysError
    }
    if (writeResponse)
    {
        setCurlOption({CURLOPT_WRITEDATA, &onBytesReceived}); //throw SysError
        setCurlOption({CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper}); //throw SysError
    }
    if (readRequest)
    {
        if (std::all_of(extraOptions.begin(), extraOptions.end(), [](const CurlOption& o) { return o.option != CURLOPT_POST; }))
        /**/setCurlOption({CURLOPT_UPLOAD, 1}); //throw SysError
        //issues HTTP PUT

        setCurlOption({CURLOPT_READDATA, &getBytesToSend}); //throw SysError
        setCurlOption({CURLOPT_READFUNCTION, getBytesToSendWrapper}); //throw SysError

        //Contradicting options: CURLOPT_READFUNCTION, CURLOPT_POSTFIELDS:
        if (std::any_of(extraOptions.begin(), extraOptions.end(), [](const CurlOption& o) { return o.option == CURLOPT_POSTFIELDS; }))
        /**/ throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    }

    if (std::any_of(extraOptions.begin(), extraOptions.end(), [](const CurlOption& o) { return o.option == CURLOPT_WRITEFUNCTION || o.option == CURLOPT_READFUNCTION; }))
    /**/ throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!"); //Option already used here!

    //---------------------------------------------------
    curl_slist* headers = nullptr; //"libcurl will not copy the entire list so you must keep it!"
    PSYNC_ON_SCOPE_EXIT(::curl_slist_free_all(headers));

    for (const std::string& headerLine : extraHeaders)
        headers = ::curl_slist_append(headers, headerLine.c_str());

    //1-sec delay when server doesn't support "Expect: 100-continue": https://stackoverflow.com/questions/49670008/how-to-disable-expect-100-continue-in-libcurl
    headers = ::curl_slist_append(headers, "Expect:");

    if (headers)
        setCurlOption({CURLOPT_HTTPHEADER, headers}); //throw SysError
    //---------------------------------------------------

    for (const CurlOption& option : extraOptions)
        setCurlOption(option); //throw SysError

    //=======================================================================================================
    const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
    //curl_easy_perform() considers HTTP response codes 4XX as success (unless CURLOPT_FAILONERROR)
    //=> let caller handle HTTP status

    if (userCallbackException)
        std::rethrow_exception(userCallbackException); //throw X
    //=======================================================================================================

    long httpStatus = 0; //optional
    /*const CURLcode rc = */ ::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &httpStatus);

    if (rcPerf != CURLE_OK)
    {
        std::wstring errorMsg = trimCpy(utfTo<std::wstring>(curlErrorBuf)); //optional

        if (httpStatus != 0) //optional
            errorMsg += (errorMsg.empty() ? L"" : L"\n") + formatHttpStatus(httpStatus);

        throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
    }

    lastSuccessfulUseTime_ = std::chrono::steady_clock::now();
    return {static_cast<int>(httpStatus)};
}


std::wstring psync::formatHttpStatus(int httpStatus)
{
    const wchar_t* statusText = [&]
    {
        switch (httpStatus)
        {
            //*INDENT-OFF*
            case 400: return L"Bad Request";
            case 401: return L"Unauthorized";
            case 403: return L"Forbidden";
            case 404: return L"Not Found";
            case 405: return L"Method Not Allowed";
            case 408: return L"Request Timeout";
            case 409: return L"Conflict";
            case 410: return L"Gone";
            case 413: return L"Content Too Large";
            case 429: return L"Too Many Requests";
            case 500: return L"Internal Server Error";
            case 501: return L"Not Implemented";
            case 502: return L"Bad Gateway";
            case 503: return L"Service Unavailable";
            case 504: return L"Gateway Timeout";
            //*INDENT-ON*
        }
        return L"";
    }();

    std::wstring msg = replaceCpy<std::wstring>(L"HTTP status %x", L"%x", numberTo<std::wstring>(httpStatus));
    if (*statusText)
        msg += std::wstring(L": ") + statusText;
    return msg;
}


std::wstring psync::formatCurlStatusCode(CURLcode sc)
{
    switch (sc)
    {
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_OK);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_UNSUPPORTED_PROTOCOL);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_FAILED_INIT);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_URL_MALFORMAT);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_NOT_BUILT_IN);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_PROXY);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_HOST);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_CONNECT);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_WEIRD_SERVER_REPLY);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_ACCESS_DENIED);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_HTTP2);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_PARTIAL_FILE);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_HTTP_RETURNED_ERROR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_WRITE_ERROR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_UPLOAD_FAILED);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_READ_ERROR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_OUT_OF_MEMORY);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_OPERATION_TIMEDOUT);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_RANGE_ERROR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CONNECT_ERROR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_DOWNLOAD_RESUME);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_ABORTED_BY_CALLBACK);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_FUNCTION_ARGUMENT);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_INTERFACE_FAILED);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_TOO_MANY_REDIRECTS);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_UNKNOWN_OPTION);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_GOT_NOTHING);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_ERROR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_RECV_ERROR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CERTPROBLEM);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CIPHER);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_PEER_FAILED_VERIFICATION);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_CONTENT_ENCODING);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_FILESIZE_EXCEEDED);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_USE_SSL_FAILED);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_FAIL_REWIND);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_LOGIN_DENIED);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_DISK_FULL);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_NOT_FOUND);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_SHUTDOWN_FAILED);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_AGAIN);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CACERT_BADFILE);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CRL_BADFILE);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_ISSUER_ERROR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_CHUNK_FAILED);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_NO_CONNECTION_AVAILABLE);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_PINNEDPUBKEYNOTMATCH);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_INVALIDCERTSTATUS);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_HTTP2_STREAM);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_RECURSIVE_API_CALL);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_AUTH_ERROR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_HTTP3);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_QUIC_CONNECT_ERROR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_PROXY);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CLIENTCERT);
            PSYNC_CHECK_CASE_FOR_CONSTANT(CURLE_UNRECOVERABLE_POLL);
        default:
            break;
    }
    return replaceCpy<std::wstring>(L"Curl status %x", L"%x", numberTo<std::wstring>(static_cast<int>(sc)));
}
