#pragma once
#include <string>
#include <curl/curl.h>
#include "../interfaces/IPageFetcher.hpp"

namespace LinkScope {

// Maps a failed transfer to a failure category. The CURLcode decides where it can;
// the error text is only consulted for codes that carry no category of their own.
FetchFailure ClassifyCurlError(CURLcode code, const std::string& message);

const char* FailureName(FetchFailure failure);

}
