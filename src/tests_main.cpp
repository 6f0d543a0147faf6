#include <iostream>

#include <curl/curl.h>

#include "tests.h"

int main() {
  const CURLcode init = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (init != CURLE_OK) {
    std::cerr << "curl_global_init failed: " << curl_easy_strerror(init) << "\n";
    return 1;
  }
  const int failures = rp_tests::run_all();
  curl_global_cleanup();
  return failures == 0 ? 0 : 1;
}
