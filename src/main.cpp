#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <guild/execution/engine.hpp>
#include <guild/storage/rocksdb/storage.hpp>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace guild::schema;

using encoder_t =
    guild::schema::encoding::encoder<guild::schema::encoding::scale_encoder_tag>;

// Malformed command line; distinct from every governance error code.
constexpr int kUsageError = 64;

struct usage_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

principal_t parse_principal(const std::string& text, std::string_view what) {
  auto parsed = try_make_hash32(text);
  if (!parsed) {
    throw usage_error{std::string{what} + " must be 32-byte hex: " + text};
  }
  return *parsed;
}

hash32_t parse_block(const std::string& text, std::string_view what) {
  auto parsed = try_make_bytes32(text);
  if (!parsed) {
    throw usage_error{std::string{what} +
                      " must be up to 32 ASCII bytes or 32-byte hex: " + text};
  }
  return *parsed;
}

amount_t parse_amount(const std::string& text, std::string_view what) {
  auto parsed = try_make_amount(text);
  if (!parsed) {
    throw usage_error{std::string{what} + " must be a uint256 decimal: " +
                      text};
  }
  return *parsed;
}

uint64_t parse_sequence(const std::string& text) {
  auto parsed = try_make_amount(text);
  if (!parsed || *parsed > std::numeric_limits<uint64_t>::max()) {
    throw usage_error{"sequence must be a uint64 decimal: " + text};
  }
  return static_cast<uint64_t>(*parsed);
}

// A url is one block per argument, at most four; missing blocks stay zero.
proposal_url_t parse_url(const std::vector<std::string>& blocks) {
  if (blocks.empty() || blocks.size() > 4) {
    throw usage_error{"url takes between one and four blocks"};
  }
  auto url = proposal_url_t{};
  for (auto i = std::size_t{0}; i < blocks.size(); ++i) {
    url[i] = parse_block(blocks[i], "url block");
  }
  return url;
}

guild::execution::genesis_member parse_genesis(const std::string& text) {
  auto separator = text.find(':');
  if (separator == std::string::npos) {
    throw usage_error{"genesis must be principal:handle: " + text};
  }
  return guild::execution::genesis_member{
      .member = parse_principal(text.substr(0, separator), "genesis principal"),
      .handle = parse_block(text.substr(separator + 1), "genesis handle")};
}

std::string render_block(const hash32_t& block) {
  return try_make_ascii(block).value_or(to_hex(block));
}

void print_result(const operation_result_t& result) {
  if (!result.ok()) {
    std::cout << "error " << result.code << " " << result.log;
    if (!result.info.empty()) {
      std::cout << ": " << result.info;
    }
    std::cout << std::endl;
    return;
  }
  std::cout << "ok";
  if (!result.info.empty()) {
    std::cout << " " << result.info;
  }
  std::cout << std::endl;
  if (!result.data.empty()) {
    std::cout << "data " << to_hex(make_bytes_view(result.data)) << std::endl;
  }
}

void print_event(const governance_event_t& event) {
  std::cout << event.sequence << " " << event.time << " "
            << to_string(event.type);
  for (const auto& attribute : event.attributes) {
    std::cout << " " << attribute.key << "=" << attribute.value;
  }
  std::cout << std::endl;
}

void print_member(const member_state_t& member) {
  std::cout << "member " << to_hex(member.member) << std::endl
            << "sponsor " << to_hex(member.sponsor) << std::endl
            << "handle " << render_block(member.handle) << std::endl
            << "time_joined " << member.time_joined << std::endl
            << "last_action_time " << member.last_action_time << std::endl;
}

void print_proposal(const proposal_state_t& proposal) {
  std::cout << "id " << to_hex(proposal.id) << std::endl
            << "sponsor " << to_hex(proposal.sponsor) << std::endl;
  for (const auto& block : proposal.url) {
    if (!is_zero(block)) {
      std::cout << "url " << render_block(block) << std::endl;
    }
  }
  std::cout << "digest " << to_hex(proposal.digest) << std::endl
            << "wallet " << to_hex(proposal.wallet) << std::endl
            << "value " << proposal.value.str() << std::endl
            << "time_submitted " << proposal.time_submitted << std::endl;
}

void require_arguments(const std::vector<std::string>& arguments,
                       const std::size_t count,
                       const std::string_view usage) {
  if (arguments.size() != count) {
    throw usage_error{"usage: guild " + std::string{usage}};
  }
}

int run_command(guild::execution::engine& engine,
                const std::string& command,
                const std::vector<std::string>& arguments) {
  auto finish = [](const operation_result_t& result) {
    print_result(result);
    return static_cast<int>(result.code);
  };

  if (command == "donate") {
    require_arguments(arguments, 2, "donate <donor> <amount>");
    return finish(engine.donate(parse_principal(arguments[0], "donor"),
                                parse_amount(arguments[1], "amount")));
  }
  if (command == "sponsor") {
    require_arguments(arguments, 3, "sponsor <caller> <member> <handle>");
    return finish(
        engine.sponsor_member(parse_principal(arguments[0], "caller"),
                              parse_principal(arguments[1], "member"),
                              parse_block(arguments[2], "handle")));
  }
  if (command == "veto-member") {
    require_arguments(arguments, 2, "veto-member <caller> <member>");
    return finish(engine.veto_member(parse_principal(arguments[0], "caller"),
                                     parse_principal(arguments[1], "member")));
  }
  if (command == "submit") {
    if (arguments.size() < 5) {
      throw usage_error{
          "usage: guild submit <caller> <digest> <wallet> <value> <url>..."};
    }
    return finish(engine.submit_proposal(
        parse_principal(arguments[0], "caller"),
        parse_url({std::begin(arguments) + 4, std::end(arguments)}),
        parse_principal(arguments[1], "digest"),
        parse_principal(arguments[2], "wallet"),
        parse_amount(arguments[3], "value")));
  }
  if (command == "veto-proposal") {
    require_arguments(arguments, 2, "veto-proposal <caller> <proposal_id>");
    return finish(
        engine.veto_proposal(parse_principal(arguments[0], "caller"),
                             parse_principal(arguments[1], "proposal_id")));
  }
  if (command == "claim") {
    require_arguments(arguments, 2, "claim <caller> <proposal_id>");
    return finish(
        engine.claim_proposal(parse_principal(arguments[0], "caller"),
                              parse_principal(arguments[1], "proposal_id")));
  }
  if (command == "member") {
    require_arguments(arguments, 1, "member <principal>");
    auto member = engine.get_member(parse_principal(arguments[0], "member"));
    if (!member) {
      std::cout << "not a member" << std::endl;
      return static_cast<int>(to_code(governance_error_code::not_a_member));
    }
    print_member(*member);
    return 0;
  }
  if (command == "proposal") {
    require_arguments(arguments, 1, "proposal <proposal_id>");
    auto proposal =
        engine.get_proposal(parse_principal(arguments[0], "proposal_id"));
    if (!proposal) {
      std::cout << "proposal not found" << std::endl;
      return static_cast<int>(
          to_code(governance_error_code::proposal_not_found));
    }
    print_proposal(*proposal);
    return 0;
  }
  if (command == "treasury") {
    require_arguments(arguments, 0, "treasury");
    std::cout << engine.treasury_balance().str() << std::endl;
    return 0;
  }
  if (command == "events") {
    if (arguments.size() > 2) {
      throw usage_error{"usage: guild events [from] [to]"};
    }
    const auto from = arguments.empty() ? 1 : parse_sequence(arguments[0]);
    const auto to = arguments.size() < 2 ? std::numeric_limits<uint64_t>::max()
                                         : parse_sequence(arguments[1]);
    for (const auto& event : engine.events(from, to)) {
      print_event(event);
    }
    return 0;
  }
  if (command == "info") {
    require_arguments(arguments, 0, "info");
    const auto info = engine.info();
    std::cout << "data " << info.data << std::endl
              << "version " << info.app_version << std::endl
              << "last_sequence " << info.last_sequence << std::endl
              << "state_root " << to_hex(info.state_root) << std::endl
              << "treasury " << info.treasury_balance.str() << std::endl
              << "members " << info.member_count << std::endl
              << "proposals " << info.proposal_count << std::endl;
    return 0;
  }
  throw usage_error{"unknown command: " + command};
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::warn);

  auto db_path = std::string{};
  auto log_path = std::string{};
  auto now = uint64_t{};
  auto genesis = std::vector<std::string>{};
  auto command = std::string{};
  auto arguments = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Guild"};
  description.add_options()("help,h", "Show the help message")(
      "db,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "guild.db"),
      "Path of the RocksDB ledger")(
      "log",
      boost::program_options::value<std::string>(&log_path)->default_value(
          "guild.log"),
      "Path of the log file")(
      "now,n", boost::program_options::value<uint64_t>(&now),
      "Current time in seconds; the system clock when omitted")(
      "genesis,g",
      boost::program_options::value<std::vector<std::string>>(&genesis)
          ->composing(),
      "Founding member principal:handle, applied to a new ledger only")(
      "release-handle-on-veto", "Free the handle of a vetoed member")(
      "strict-proposal-veto", "Reject vetoes of unknown proposals")(
      "verbose,v", "Enable verbose output");

  auto hidden = boost::program_options::options_description{};
  hidden.add_options()("command",
                       boost::program_options::value<std::string>(&command))(
      "arguments",
      boost::program_options::value<std::vector<std::string>>(&arguments));

  auto all = boost::program_options::options_description{};
  all.add(description).add(hidden);

  auto positional = boost::program_options::positional_options_description{};
  positional.add("command", 1).add("arguments", -1);

  try {
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv)
            .options(all)
            .positional(positional)
            .run(),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return kUsageError;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << "usage: guild [options] <command> [arguments]" << std::endl
              << "commands: donate sponsor veto-member submit veto-proposal "
                 "claim member proposal treasury events info"
              << std::endl
              << description << std::endl;
    return vm.contains("help") ? 0 : kUsageError;
  }

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "guild", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  auto options = guild::execution::engine_options{};
  options.release_handle_on_member_veto = vm.contains("release-handle-on-veto");
  options.strict_proposal_veto = vm.contains("strict-proposal-veto");

  auto exit_code = 0;
  try {
    std::ranges::transform(genesis, std::back_inserter(options.genesis_members),
                           parse_genesis);

    auto clock = vm.contains("now")
                     ? guild::execution::clock_source_t{[now] { return now; }}
                     : guild::execution::make_system_clock();

    auto encoder = encoder_t{};
    auto storage =
        guild::storage::make_storage<guild::storage::rocksdb_storage_tag>(
            db_path);
    auto engine = guild::execution::engine{encoder, storage, std::move(clock),
                                           std::move(options)};
    exit_code = run_command(engine, command, arguments);
  } catch (const usage_error& e) {
    std::cerr << e.what() << std::endl;
    exit_code = kUsageError;
  }

  spdlog::shutdown();
  return exit_code;
}
