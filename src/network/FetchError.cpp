#include "FetchError.hpp"
#include "../utils/UrlUtil.hpp"

namespace LinkScope {

static inline bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

FetchFailure ClassifyCurlError(CURLcode code, const std::string& message) {
    switch (code) {
        case CURLE_OK:
            return FetchFailure::None;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_ENGINE_NOTFOUND:
        case CURLE_SSL_ENGINE_SETFAILED:
        case CURLE_SSL_ENGINE_INITFAILED:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_SHUTDOWN_FAILED:
        case CURLE_SSL_CRL_BADFILE:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
        case CURLE_SSL_INVALIDCERTSTATUS:
        case CURLE_SSL_CLIENTCERT:
        case CURLE_USE_SSL_FAILED:
            return FetchFailure::Tls;
        case CURLE_OPERATION_TIMEDOUT:
            return FetchFailure::Timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
            return FetchFailure::Connect;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return FetchFailure::Input;
        default:
            break;
    }

    const std::string text = UrlUtil::ToLower(message);
    if (contains(text, "certificate") || contains(text, "ssl") || contains(text, "tls")) {
        return FetchFailure::Tls;
    }
    if (contains(text, "timed out") || contains(text, "timeout")) {
        return FetchFailure::Timeout;
    }
    if (contains(text, "resolve") || contains(text, "lookup") || contains(text, "connect")) {
        return FetchFailure::Connect;
    }
    return FetchFailure::Other;
}

const char* FailureName(FetchFailure failure) {
    switch (failure) {
        case FetchFailure::None:    return "none";
        case FetchFailure::Input:   return "input";
        case FetchFailure::Tls:     return "tls";
        case FetchFailure::Timeout: return "timeout";
        case FetchFailure::Connect: return "connect";
        case FetchFailure::Status:  return "status";
        case FetchFailure::Other:   return "other";
    }
    return "unknown";
}

}
