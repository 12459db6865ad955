#include "downloader.hpp"
#include "cleanup.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace {

size_t write_to_stream(void* ptr, size_t size, size_t nmemb, void* stream) {
    std::ostream* out = static_cast<std::ostream*>(stream);
    size_t bytes = size * nmemb;
    out->write(static_cast<char*>(ptr), bytes);
    return out->good() ? bytes : 0;
}

size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    out->append(static_cast<char*>(ptr), bytes);
    return bytes;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
    if (interrupt_requested()) {
        return 1;
    }
    const bool show_progress = clientp != nullptr && *static_cast<bool*>(clientp);
    if (!show_progress || dltotal <= 0) {
        return 0;
    }
    double percentage = static_cast<double>(dlnow) / static_cast<double>(dltotal) * 100.0;
    log_progress(get_string("info.downloading"), percentage);
    return 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

CurlHandle make_handle(const std::string& url, bool* show_progress) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw NetworkException(string_format("error.download_failed", url));
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "mboot/" MBOOT_VERSION);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, show_progress);
    return curl;
}

void perform(CURL* curl, const std::string& url) {
    CURLcode res = curl_easy_perform(curl);
    end_progress();
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw_if_interrupted();
    }
    if (res != CURLE_OK) {
        throw NetworkException(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
}

} // anonymous namespace

void download_file(const std::string& url, const fs::path& output_path, bool show_progress) {
    std::ofstream ofile(output_path, std::ios::binary | std::ios::trunc);
    if (!ofile) {
        throw MbootException(string_format("error.create_file_failed", output_path.string()));
    }

    CurlHandle curl = make_handle(url, &show_progress);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, static_cast<std::ostream*>(&ofile));
    perform(curl.get(), url);

    ofile.close();
    if (!ofile) {
        throw MbootException(string_format("error.write_file_failed", output_path.string()));
    }
}

std::string fetch_text(const std::string& url) {
    bool show_progress = false;
    std::string body;
    CurlHandle curl = make_handle(url, &show_progress);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    perform(curl.get(), url);
    return body;
}
