#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "herald/byte-buffer.hpp"
#include "herald/charset.hpp"
#include "herald/connection-outbound.hpp"
#include "herald/exchange-info.hpp"
#include "herald/http-constants.hpp"
#include "herald/http-method.hpp"
#include "herald/http-outbound.hpp"
#include "herald/log.hpp"
#include "herald/outbound-config.hpp"
#include "herald/outbound-sink.hpp"
#include "herald/payload-stream.hpp"
#include "herald/response-head.hpp"
#include "herald/send-error.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

using namespace herald;

namespace {

class StdoutSink : public OutboundSink {
 public:
  bool write(std::span<const std::byte> data) override {
    std::cout.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(std::cout);
  }
};

void Report(std::string_view what, const SendResult &result) {
  if (result) {
    log::info("{} sent", what);
  } else {
    log::error("{} failed: {} ({})", what, result.error().message(), SendErrcName(result.error().code()));
  }
}

}  // namespace

// Usage: herald_chunked_response [charset] [-v]
// Writes to stdout a chunked HTTP/1.1 response whose body parts are sent concurrently by several threads.
int main(int argc, char **argv) {
  // logs go to stderr, the response to stdout
  log::set_default_logger(log::stderr_color_mt("herald"));

  OutboundConfig config;
  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view arg(argv[argPos]);
    if (arg == "-v") {
      log::set_level(log::level::debug);
      config.withTraceSends();
    } else if (auto charset = CharsetFromName(arg)) {
      config.withCharset(*charset);
    } else {
      std::cerr << "Unknown charset: " << arg << '\n';
      return EXIT_FAILURE;
    }
  }
  try {
    StdoutSink sink;
    ResponseHead head;
    head.addHeader(http::ContentType, std::string("text/plain; charset=").append(CharsetName(config.charset)));
    ConnectionOutbound conn(sink, std::move(head));
    HttpOutbound outbound(conn, ExchangeInfo{http::Method::GET, "/greetings", false}, config);

    std::vector<std::jthread> senders;
    for (std::string_view greeting : {"Hello\n", "Bonjour\n", "Gr\xC3\xBC\xC3\x9F Gott\n", "Ol\xC3\xA1\n"}) {
      senders.emplace_back([&outbound, greeting] {
        outbound.sendText(PayloadStream<std::string>::Of({std::string(greeting)}))
            .subscribe([greeting](SendResult result) { Report(greeting.substr(0, greeting.size() - 1), result); });
      });
    }
    senders.clear();

    conn.flush();
    conn.end().subscribe([](SendResult result) { Report("last chunk", result); });
    conn.flush();
    std::cout.flush();
  } catch (const std::exception &e) {
    std::cerr << "Response encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
