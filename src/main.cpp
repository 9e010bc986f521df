#include <unistd.h>
#include <mutex>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <autojudge/logger.h>
#include <autojudge/errors.h>
#include <autojudge/evaluation.h>
#include <autojudge/first_track.h>
#include <autojudge/moderation.h>
#include <autojudge/notification.h>
#include <autojudge/paths.h>
#include <autojudge/utils.h>
#include "database.h"
#include "contest_directory.h"
#include "console_messenger.h"

namespace {

fs::path kDatabasePath = "/var/lib/autojudge/db.sqlite";
fs::path kDirectoryPath = "/etc/autojudge/contest.json";
fs::path kCatalogPath;
fs::path kOutboxPath = "/var/lib/autojudge/outbox";

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string storage_root = ini[""]["storage_root"] | "";
  std::string box_root = ini[""]["box_root"] | "";
  std::string data_dir = ini[""]["data_dir"] | "";
  std::string database = ini[""]["database"] | "";
  std::string directory = ini[""]["directory"] | "";
  std::string catalog = ini[""]["catalog"] | "";
  std::string outbox = ini[""]["outbox"] | "";
  if (storage_root.size()) kStorageRoot = storage_root;
  if (box_root.size()) kBoxRoot = box_root;
  if (data_dir.size()) internal::kDataDir = data_dir;
  if (database.size()) kDatabasePath = database;
  if (directory.size()) kDirectoryPath = directory;
  if (catalog.size()) kCatalogPath = catalog;
  if (outbox.size()) kOutboxPath = outbox;
  kSandboxTimeout = ini[""]["sandbox_timeout"] | kSandboxTimeout;
  kSandboxUid = ini[""]["sandbox_uid"] | kSandboxUid;
  kFilePartLimit = (ini[""]["part_limit_mb"] | (kFilePartLimit / 1024 / 1024)) * 1024 * 1024;
  kMaxRSS = (ini[""]["max_rss_mb"] | (kMaxRSS / 1024)) * 1024;
  kMaxOutput = (ini[""]["max_output_mb"] | (kMaxOutput / 1024)) * 1024;
  return true;
}

struct Command {
  std::string name;
  std::vector<std::string> args;
};

Command ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "autojudge");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/autojudge.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Wall-clock limit of a sandbox run in seconds");
  parser.add_argument("--part-limit-mb")
    .scan<'d', long>()
    .help("Maximum size of one uploaded part");
  parser.add_argument("command")
    .help("submit <membership> <file.zip> | submit-parts <membership> <parts...> | "
          "rejudge <submission> | override <submission> <rate|rerate> <status> [value|skip] | "
          "download <submission> <chat>");
  parser.add_argument("args")
    .remaining()
    .help("Command arguments");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<long>("--timeout")) {
    kSandboxTimeout = val.value();
  }
  if (auto val = parser.present<long>("--part-limit-mb")) {
    kFilePartLimit = val.value() * 1024 * 1024;
  }
  kFilePartLimit = std::max(kFilePartLimit, 1024L * 1024);
  Command ret;
  ret.name = parser.get<std::string>("command");
  if (auto args = parser.present<std::vector<std::string>>("args")) ret.args = std::move(*args);
  return ret;
}

TextCatalog LoadCatalog() {
  if (kCatalogPath.empty()) return TextCatalog();
  return TextCatalog::Load(kCatalogPath);
}

// Everything a command needs, wired once
struct App {
  Database db;
  JsonContestDirectory directory;
  TextCatalog catalog;
  ConsoleMessenger messenger;
  CJailRuntime runtime;
  SandboxedUnzip unzip;
  ScorerRegistry registry;
  ResultCache cache;
  std::mutex eval_lock;
  NotificationDiffer differ;
  UpdateFn update;
  EvaluationCoordinator coordinator;
  CreateFn create;

  App() :
      db(kDatabasePath.string()),
      directory(JsonContestDirectory::Load(kDirectoryPath)),
      catalog(LoadCatalog()),
      messenger(kOutboxPath),
      unzip(runtime),
      differ(directory, messenger, catalog, [this](long id) { return db.Get(id); }),
      update(differ.Wrap([this](const SubmissionUpdate& u) { return db.Update(u); })),
      coordinator(directory, registry, cache, eval_lock, update),
      create(coordinator.InterceptCreate([this](const Submission& s) { return db.Create(s); })) {
    RegisterDefaultScorers(registry, runtime, unzip);
    registry.Seal();
  }

  std::optional<long> ChatOf(long membership_id) {
    auto membership = directory.GetMembership(membership_id);
    if (!membership) return std::nullopt;
    auto user = directory.GetRecipient(membership->user_id);
    return user ? user->chat_id : std::nullopt;
  }

  void Reply(std::optional<long> chat, const std::string& text) {
    if (chat) {
      messenger.SendMessage(*chat, text);
    } else {
      std::cout << text << std::endl;
    }
  }
};

PartFetcher LocalFetcher(const fs::path& src) {
  return [src](const fs::path& dest) {
    std::error_code ec;
    fs::copy_file(src, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) spdlog::warn("Cannot read {}: {}", src.c_str(), ec.message());
    return !ec;
  };
}

long FileSize(const fs::path& path) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (ec) throw TransferError("cannot read " + path.string());
  return size;
}

void ReportSubmitted(App& app, long membership_id, const TransferReply& reply) {
  auto chat = app.ChatOf(membership_id);
  app.Reply(chat, DescribeTransfer(app.catalog, reply));
  if (reply.signal == TransferSignal::SUBMITTED && reply.submission) {
    app.Reply(chat, DescribeOutcome(app.catalog, app.cache.Pop(reply.submission->id)));
  }
}

int RunSubmit(App& app, const std::vector<std::string>& args) {
  if (args.size() != 2) return 2;
  long membership_id = std::stol(args[0]);
  fs::path file = args[1];
  TransferAssembler assembler(
      [&]() { return PlanSubmission(app.directory, app.db, membership_id); }, app.create);
  auto reply = assembler.OfferDocument(file.filename().string(), FileSize(file), LocalFetcher(file));
  ReportSubmitted(app, membership_id, reply);
  return reply.signal == TransferSignal::SUBMITTED ? 0 : 1;
}

int RunSubmitParts(App& app, const std::vector<std::string>& args) {
  if (args.size() < 2) return 2;
  long membership_id = std::stol(args[0]);
  auto chat = app.ChatOf(membership_id);
  TransferAssembler assembler(
      [&]() { return PlanSubmission(app.directory, app.db, membership_id); }, app.create);
  app.Reply(chat, DescribeTransfer(app.catalog, assembler.BeginChunked()));
  auto reply = assembler.SetPartCount(std::to_string(args.size() - 1));
  app.Reply(chat, DescribeTransfer(app.catalog, reply));
  if (reply.signal != TransferSignal::READY) return 1;
  for (size_t i = 1; i < args.size(); i++) {
    fs::path file = args[i];
    reply = assembler.OfferDocument(file.filename().string(), FileSize(file), LocalFetcher(file));
    if (reply.signal == TransferSignal::SUBMITTED) break;
    app.Reply(chat, DescribeTransfer(app.catalog, reply));
    if (reply.signal != TransferSignal::PART_SAVED) return 1;
  }
  ReportSubmitted(app, membership_id, reply);
  return reply.signal == TransferSignal::SUBMITTED ? 0 : 1;
}

int RunRejudge(App& app, const std::vector<std::string>& args) {
  if (args.size() != 1) return 2;
  auto sub = app.db.Get(std::stol(args[0]));
  if (!sub) {
    spdlog::error("Submission {} not found", args[0]);
    return 1;
  }
  auto outcome = app.coordinator.EvaluateAsync(*sub).get();
  app.cache.Pop(sub->id);
  std::cout << DescribeOutcome(app.catalog, outcome) << std::endl;
  return outcome && outcome->success ? 0 : 1;
}

int RunOverride(App& app, const std::vector<std::string>& args) {
  if (args.size() != 3 && args.size() != 4) return 2;
  OverrideRequest req;
  req.submission_id = std::stol(args[0]);
  auto action = GetOverrideAction(args[1]);
  auto status = GetSubmissionStatus(args[2]);
  if (!action || !status) return 2;
  req.action = *action;
  req.status = *status;
  if (args.size() == 4 && !ParseOverrideValue(args[3], req.value)) return 2;
  auto get = [&](long id) { return app.db.Get(id); };
  OverrideResult res = ApplyOverride(get, app.update, req);
  std::string key = "admin.override." + ToLower(OverrideResultName(res));
  std::cout << app.catalog.Get(key, {{"id", args[0]}}) << std::endl;
  return res == OverrideResult::APPLIED ? 0 : 1;
}

int RunDownload(App& app, const std::vector<std::string>& args) {
  if (args.size() != 2) return 2;
  auto sub = app.db.Get(std::stol(args[0]));
  if (!sub) {
    spdlog::error("Submission {} not found", args[0]);
    return 1;
  }
  if (!SendSubmissionArtifact(app.messenger, std::stol(args[1]), *sub, kFilePartLimit)) {
    spdlog::error("Artifact of submission {} is not available", sub->id);
    return 1;
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  Command cmd = ParseArgs(argc, argv);
  bool runs_sandbox = cmd.name == "submit" || cmd.name == "submit-parts" || cmd.name == "rejudge";
  if (runs_sandbox && geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  int ret = 2;
  try {
    App app;
    if (cmd.name == "submit") ret = RunSubmit(app, cmd.args);
    else if (cmd.name == "submit-parts") ret = RunSubmitParts(app, cmd.args);
    else if (cmd.name == "rejudge") ret = RunRejudge(app, cmd.args);
    else if (cmd.name == "override") ret = RunOverride(app, cmd.args);
    else if (cmd.name == "download") ret = RunDownload(app, cmd.args);
  } catch (const std::exception& err) {
    spdlog::error("{}: {}", cmd.name, err.what());
    return 1;
  }
  if (ret == 2) spdlog::error("Invalid arguments for command {}", cmd.name);
  return ret;
}
