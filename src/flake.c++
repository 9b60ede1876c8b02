#include "util/common.h++"
#include "generator.h++"
#include "encoding.h++"
#include "bulk.h++"
#include <spdlog/fmt/ranges.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <optparse.h>
#include <exception>

using namespace Flake;
using std::stoll, std::stoull, std::string;

static auto print_decomposed(const Generator& gen, uint64_t id) -> void {
  const auto d = gen.decompose(id);
  const auto minted_ms = timestamp_to_nanos(d.timestamp(gen.epoch(), gen.tick())) / 1'000'000;
  fmt::print("id:             {}\n", d.id);
  fmt::print("time:           {} ({}ms since unix epoch)\n", d.time, minted_ms);
  fmt::print("sequence:       {}\n", d.sequence);
  fmt::print("data_center_id: {}\n", d.data_center_id);
  fmt::print("machine_id:     {}\n", d.machine_id);
  fmt::print("binary:         {}\n", Encoding::to_binary(id));
  fmt::print("base32:         {}\n", Encoding::to_base32(id));
  fmt::print("base36:         {}\n", Encoding::to_base36(id));
  fmt::print("base58:         {}\n", Encoding::to_base58(id));
  fmt::print("base64:         {}\n", Encoding::to_base64(id));
  const auto bytes = Encoding::to_bytes(id);
  fmt::print("bytes:          {:02x}\n", fmt::join(bytes, " "));
}

static auto generate_threaded(Generator gen, uint64_t count, uint64_t threads) -> int {
  const auto result = generate_bulk(gen, count, threads);
  spdlog::info("Generated {} IDs on {} threads in {:.3f}s ({:.0f} IDs/sec), {} unique",
    result.ids.size(), threads, result.seconds,
    result.seconds > 0 ? result.ids.size() / result.seconds : 0.0, result.unique);
  return result.unique == count ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char** argv) {
  auto parser = optparse::OptionParser()
    .version(string(VERSION))
    .description("Generates and decomposes 63-bit Snowflake IDs");
  parser.add_option("-n", "--count")
    .dest("count")
    .type("INT")
    .help("number of IDs to generate (default = 1)")
    .set_default(1);
  parser.add_option("-m", "--machine-id")
    .dest("machine_id")
    .type("INT")
    .help("machine id (default = 0, or derived from the network with --network-identity)");
  parser.add_option("-d", "--data-center-id")
    .dest("data_center_id")
    .type("INT")
    .help("data center id (default = 0, or derived from the network with --network-identity)");
  parser.add_option("--network-identity")
    .dest("network_identity")
    .nargs(0)
    .help("derive ids not given on the command line from a private network address");
  parser.add_option("--epoch")
    .dest("epoch")
    .type("MILLIS")
    .help("epoch in unix milliseconds (default = 1640995200000, 2022-01-01)");
  parser.add_option("--tick-ms")
    .dest("tick_ms")
    .type("INT")
    .help("length of one tick in milliseconds (default = 1)")
    .set_default(1);
  parser.add_option("--layout")
    .dest("layout")
    .type("T,S,D,M")
    .help("bit widths of time, sequence, data center and machine; T,S,M for no data center (default = 41,12,5,5)")
    .set_default("41,12,5,5");
  parser.add_option("-f", "--format")
    .dest("format")
    .help("output format: decimal, binary, base32, base36, base58, base64 (default = decimal)")
    .set_default("decimal");
  parser.add_option("--decompose")
    .dest("decompose")
    .type("ID")
    .help("print the fields of an ID (in --format) instead of generating");
  parser.add_option("-t", "--threads")
    .dest("threads")
    .type("INT")
    .help("generate on this many threads and report throughput instead of printing IDs (default = 1)")
    .set_default(1);
  parser.add_option("--log-level")
    .dest("log_level")
    .help("log level (debug, info, warn, error, critical)")
    .set_default("warn");
  parser.add_help_option();

  const optparse::Values options = parser.parse_args(argc, argv);
  spdlog::set_default_logger(spdlog::stderr_color_mt("flake"));
  spdlog::set_level(spdlog::level::from_str(options["log_level"]));

  const auto layout = parse_layout(options["layout"]);
  if (!layout) {
    spdlog::critical("Invalid --layout: {} (must be T,S,D,M or T,S,M)", options["layout"]);
    return EXIT_FAILURE;
  }
  const auto format = Encoding::parse_format(options["format"]);
  if (!format) {
    spdlog::critical("Invalid --format: {}", options["format"]);
    return EXIT_FAILURE;
  }

  try {
    auto builder = Generator::builder()
      .layout(*layout)
      .tick(std::chrono::milliseconds(stoll(options["tick_ms"])))
      .identity_from_network(options.is_set_by_user("network_identity"));
    if (options.is_set_by_user("epoch")) builder.epoch(millis_to_timestamp(stoll(options["epoch"])));
    if (options.is_set_by_user("machine_id")) builder.machine_id(stoull(options["machine_id"]));
    if (options.is_set_by_user("data_center_id")) builder.data_center_id(stoull(options["data_center_id"]));
    auto gen = builder.finalize();

    if (options.is_set_by_user("decompose")) {
      const auto id = Encoding::from_string(options["decompose"], *format);
      if (!id) {
        spdlog::critical("Invalid {} ID: {}", options["format"], options["decompose"]);
        return EXIT_FAILURE;
      }
      print_decomposed(gen, *id);
      return EXIT_SUCCESS;
    }

    const auto count = stoull(options["count"]), threads = stoull(options["threads"]);
    if (threads > 1) return generate_threaded(gen, count, threads);
    for (uint64_t i = 0; i < count; i++) {
      fmt::print("{}\n", Encoding::to_string(gen.next(), *format));
    }
    return EXIT_SUCCESS;
  } catch (const FlakeError& e) {
    spdlog::critical("{}", e.what());
    try {
      std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
      spdlog::critical("Caused by: {}", cause.what());
    } catch (...) {
      spdlog::critical("Caused by an unknown exception");
    }
    return EXIT_FAILURE;
  } catch (const std::logic_error& e) {
    spdlog::critical("Invalid numeric option: {}", e.what());
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    spdlog::critical("ID generation failed: {}", e.what());
    return EXIT_FAILURE;
  }
}
