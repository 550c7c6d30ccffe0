#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/identity/material_store.hpp"
#include "courier/protocol/bundle_protocol.hpp"
#include "courier/protocol/hybrid_session_cipher.hpp"
#include "courier/protocol/secure_messenger.hpp"
#include "courier/relay/relay_client.hpp"
#include "courier/utilities/encoding.hpp"
#include "courier/utilities/envelope_codec.hpp"
#include "courier/utilities/json_codec.hpp"
#include <google/protobuf/struct.pb.h>
#include <fmt/chrono.h>
#include <spdlog/spdlog.h>
#include <termios.h>
#include <unistd.h>
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace courier::cli {

namespace {

using protocol::BundleProtocol;
using protocol::ErrorMessages;
using protocol::HybridSessionCipher;
using protocol::SecureMessenger;
using protocol::identity::MaterialStore;
using protocol::utilities::Encoding;
using protocol::utilities::EnvelopeCodec;
using protocol::utilities::JsonCodec;
using relay::RelayClient;

constexpr std::string_view kDefaultServer = "http://localhost:8080";
constexpr std::string_view kPassphraseVariable = "COURIER_PASSPHRASE";
constexpr uint32_t kDefaultInboxLimit = 20;

class CommandError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Unwraps `result` or throws a CommandError prefixed with `context`.
template<typename T, typename E>
T Require(protocol::Result<T, E> result, std::string_view context) {
    if (result.IsErr()) {
        throw CommandError(compat::format("{}: {}", context, result.UnwrapErr().message));
    }
    return std::move(result).Unwrap();
}

template<typename N>
N ParseNumber(const std::string& text, std::string_view option) {
    N value{};
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        throw CommandError(compat::format("--{} expects a number, got '{}'", option, text));
    }
    return value;
}

/**
 * Command words plus "--name value" / "--name=value" options. Options
 * may appear anywhere after the program name.
 */
class Arguments {
public:
    static Arguments Parse(const int argc, char** argv) {
        static const std::set<std::string, std::less<>> kFlags = {"json", "help", "verbose"};
        Arguments args;
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg.size() <= 2 || arg.substr(0, 2) != "--") {
                args.words_.emplace_back(arg);
                continue;
            }
            std::string_view name = arg.substr(2);
            if (const auto eq = name.find('='); eq != std::string_view::npos) {
                args.options_[std::string(name.substr(0, eq))] = std::string(name.substr(eq + 1));
            } else if (kFlags.count(name) != 0) {
                args.options_[std::string(name)] = "true";
            } else if (i + 1 < argc) {
                args.options_[std::string(name)] = argv[++i];
            } else {
                throw CommandError(compat::format("Option --{} needs a value", name));
            }
        }
        return args;
    }

    [[nodiscard]] const std::vector<std::string>& Words() const noexcept { return words_; }

    [[nodiscard]] std::string Word(const size_t index) const {
        return index < words_.size() ? words_[index] : std::string();
    }

    [[nodiscard]] std::optional<std::string> Option(std::string_view name) const {
        const auto it = options_.find(name);
        if (it == options_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::string RequireOption(std::string_view name) const {
        auto value = Option(name);
        if (!value || value->empty()) {
            throw CommandError(compat::format("Missing required option --{}", name));
        }
        return *value;
    }

    [[nodiscard]] bool Flag(std::string_view name) const {
        return options_.find(name) != options_.end();
    }

private:
    std::vector<std::string> words_;
    std::map<std::string, std::string, std::less<>> options_;
};

// ============================================================================
// Input and output
// ============================================================================

std::string ReadText(const std::optional<std::string>& source) {
    if (!source || *source == "-") {
        return {std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    }
    std::ifstream in(*source, std::ios::binary);
    if (!in) {
        throw CommandError(compat::format("Cannot read {}", *source));
    }
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void WriteText(const std::optional<std::string>& target, const std::string& text) {
    if (!target || *target == "-") {
        std::cout << text;
        if (!text.empty() && text.back() != '\n') {
            std::cout << '\n';
        }
        return;
    }
    std::ofstream out(*target, std::ios::binary | std::ios::trunc);
    if (!out || !out.write(text.data(), static_cast<std::streamsize>(text.size()))) {
        throw CommandError(compat::format("Cannot write {}", *target));
    }
}

std::string FormatTimestamp(const int64_t epoch_ms) {
    const auto seconds = static_cast<std::time_t>(epoch_ms / 1000);
    return compat::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(seconds), epoch_ms % 1000);
}

std::string FormatDuration(const uint32_t seconds) {
    return compat::format("{}h {}m {}s", seconds / 3600, (seconds % 3600) / 60, seconds % 60);
}

// ============================================================================
// Store and relay access
// ============================================================================

std::string ResolveDbPath(const Arguments& args) {
    if (auto db = args.Option("db")) {
        return *db;
    }
    const char* home = std::getenv("HOME");
    return compat::format("{}/.courier/courier.db", home != nullptr ? home : ".");
}

std::string PromptPassphrase() {
    std::cerr << "Passphrase: " << std::flush;
    termios saved{};
    const bool terminal = isatty(STDIN_FILENO) != 0 && tcgetattr(STDIN_FILENO, &saved) == 0;
    if (terminal) {
        termios hidden = saved;
        hidden.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &hidden);
    }
    std::string passphrase;
    std::getline(std::cin, passphrase);
    if (terminal) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        std::cerr << '\n';
    }
    return passphrase;
}

std::string ResolvePassphrase(const Arguments& args) {
    if (auto passphrase = args.Option("passphrase"); passphrase && !passphrase->empty()) {
        return *passphrase;
    }
    if (const char* env = std::getenv(std::string(kPassphraseVariable).c_str()); env != nullptr && *env != '\0') {
        return env;
    }
    auto prompted = PromptPassphrase();
    if (prompted.empty()) {
        throw CommandError("Passphrase required.");
    }
    return prompted;
}

std::unique_ptr<MaterialStore> OpenStore(const Arguments& args) {
    const std::string db_path = ResolveDbPath(args);
    return Require(MaterialStore::Open(db_path, ResolvePassphrase(args)),
                   compat::format("Cannot open {}", db_path));
}

std::string ServerUrl(const Arguments& args) {
    return args.Option("server").value_or(std::string(kDefaultServer));
}

RelayClient Connect(const Arguments& args) {
    return Require(RelayClient::ForUrl(ServerUrl(args)), "Invalid --server");
}

std::string RequireLocalId(MaterialStore& store) {
    if (!Require(store.HasIdentity(), "Cannot read identity")) {
        throw CommandError(std::string(ErrorMessages::IDENTITY_NOT_INITIALIZED));
    }
    return Require(store.GetLocalId(), "Cannot read identity");
}

std::string PrettyJson(const google::protobuf::Message& message) {
    return Require(JsonCodec::Print(message, JsonCodec::Style::Pretty), "Cannot encode JSON");
}

// ============================================================================
// Local commands
// ============================================================================

int InitCommand(const Arguments& args) {
    const std::string id = args.RequireOption("id");
    std::optional<uint32_t> device;
    if (auto text = args.Option("device")) {
        device = ParseNumber<uint32_t>(*text, "device");
    }
    const auto store = OpenStore(args);
    if (Require(store->HasIdentity(), "Cannot read identity")) {
        throw CommandError(compat::format("Identity '{}' already initialized in {}",
                                          Require(store->GetLocalId(), "Cannot read identity"),
                                          ResolveDbPath(args)));
    }
    Require(store->InitializeIdentity(id, device), "Cannot initialize identity");
    Require(store->GeneratePreKeys(1), "Cannot generate prekeys");
    std::cout << compat::format("Initialized identity '{}' in {}\n", id, ResolveDbPath(args));
    return EXIT_SUCCESS;
}

int IdentityShowCommand(const Arguments& args) {
    const auto store = OpenStore(args);
    google::protobuf::Struct info;
    auto& fields = *info.mutable_fields();
    fields["id"].set_string_value(RequireLocalId(*store));
    fields["registrationId"].set_number_value(Require(store->GetRegistrationId(), "Cannot read identity"));
    fields["deviceId"].set_number_value(Require(store->GetDeviceId(), "Cannot read identity"));
    WriteText(std::nullopt, PrettyJson(info));
    return EXIT_SUCCESS;
}

int PreKeyGenerateCommand(const Arguments& args) {
    const uint32_t count = ParseNumber<uint32_t>(args.Option("count").value_or("1"), "count");
    if (count == 0) {
        throw CommandError("--count must be at least 1");
    }
    const auto store = OpenStore(args);
    RequireLocalId(*store);
    Require(store->GeneratePreKeys(count), "Cannot generate prekeys");
    std::cout << compat::format("Generated {} prekeys.\n", count);
    return EXIT_SUCCESS;
}

int BundleExportCommand(const Arguments& args) {
    const std::string out = args.RequireOption("out");
    const auto store = OpenStore(args);
    const auto bundle = Require(BundleProtocol::ExportBundle(*store), "Cannot export bundle");
    WriteText(out, PrettyJson(bundle));
    std::cout << compat::format("Bundle exported to {}\n", out);
    return EXIT_SUCCESS;
}

int SessionInitCommand(const Arguments& args) {
    const std::string source = args.RequireOption("their-bundle");
    const auto bundle = Require(JsonCodec::ParseAs<proto::wire::Bundle>(ReadText(source)),
                                compat::format("Invalid bundle in {}", source));
    const auto store = OpenStore(args);
    RequireLocalId(*store);
    HybridSessionCipher cipher;
    Require(BundleProtocol::InitSession(*store, cipher, bundle), "Cannot initialize session");
    std::cout << compat::format("Session initialized with {}\n", bundle.id());
    return EXIT_SUCCESS;
}

int EncryptCommand(const Arguments& args) {
    const std::string to = args.RequireOption("to");
    const auto store = OpenStore(args);
    RequireLocalId(*store);
    const auto plaintext = Encoding::ToBytes(ReadText(args.Option("in")));
    HybridSessionCipher cipher;
    const auto envelope = Require(SecureMessenger::EncryptMessage(*store, cipher, to, plaintext), "Cannot encrypt");
    WriteText(args.Option("out"), Require(EnvelopeCodec::ToJson(envelope), "Cannot encode envelope"));
    return EXIT_SUCCESS;
}

int DecryptCommand(const Arguments& args) {
    const auto envelope = Require(EnvelopeCodec::FromJson(ReadText(args.Option("in"))), "Invalid envelope");
    const auto store = OpenStore(args);
    RequireLocalId(*store);
    HybridSessionCipher cipher;
    const auto plaintext = Require(SecureMessenger::DecryptMessage(*store, cipher, envelope), "Cannot decrypt");
    WriteText(args.Option("out"), Encoding::ToText(plaintext));
    return EXIT_SUCCESS;
}

// ============================================================================
// Relay commands
// ============================================================================

int ClientRegisterCommand(const Arguments& args) {
    const std::string id = args.RequireOption("id");
    const auto client = Connect(args);
    Require(client.Register(id), "Registration failed");
    std::cout << compat::format("Registered {} at {}\n", id, ServerUrl(args));
    return EXIT_SUCCESS;
}

int ClientPreKeysUploadCommand(const Arguments& args) {
    const auto client = Connect(args);
    const auto store = OpenStore(args);
    const auto bundle = Require(BundleProtocol::ExportBundle(*store), "Cannot export bundle");
    Require(client.UploadBundle(bundle.id(), bundle), "Upload failed");
    std::cout << compat::format("Uploaded prekeys for {} to {}\n", bundle.id(), ServerUrl(args));
    return EXIT_SUCCESS;
}

int ClientPreKeysFetchCommand(const Arguments& args) {
    const std::string id = args.RequireOption("id");
    const auto client = Connect(args);
    const auto bundle = Require(client.FetchBundle(id), "Fetch failed");
    WriteText(args.Option("out"), PrettyJson(bundle));
    std::cout << compat::format("Fetched prekeys for {} from {}\n", id, ServerUrl(args));
    return EXIT_SUCCESS;
}

int ClientSendCommand(const Arguments& args) {
    const std::string to = args.RequireOption("to");
    const auto client = Connect(args);
    const auto store = OpenStore(args);
    const std::string local_id = RequireLocalId(*store);
    HybridSessionCipher cipher;

    if (!Require(BundleProtocol::HasSession(*store, to, SecureMessenger::PEER_DEVICE_ID), "Cannot read sessions")) {
        const auto bundle = Require(client.FetchBundle(to), compat::format("Cannot fetch the bundle of {}", to));
        Require(BundleProtocol::InitSession(*store, cipher, bundle), "Cannot initialize session");
    }

    const auto plaintext = Encoding::ToBytes(ReadText(args.Option("in")));
    proto::wire::RelayMessage message;
    message.set_from(local_id);
    message.set_to(to);
    *message.mutable_envelope() = Require(
        SecureMessenger::EncryptMessage(*store, cipher, to, plaintext), "Cannot encrypt");
    const auto submitted = Require(client.Send(message), "Send failed");
    std::cout << compat::format("Sent message from {} to {} via {} ({})\n", local_id, to, ServerUrl(args),
                                submitted.delivered() ? "delivered" : "queued");
    return EXIT_SUCCESS;
}

int ClientListenCommand(const Arguments& args) {
    const std::string id = args.RequireOption("id");
    const auto client = Connect(args);
    const auto store = OpenStore(args);
    RequireLocalId(*store);
    HybridSessionCipher cipher;

    std::cout << compat::format("Listening for messages on ws://{}:{}/ws as {}\n", client.Host(), client.Port(), id)
              << std::flush;
    const auto listened = client.Listen(id, [&](const proto::wire::RelayMessage& frame) {
        const auto& envelope = frame.envelope();
        auto plaintext = SecureMessenger::DecryptMessage(*store, cipher, envelope);
        if (plaintext.IsErr()) {
            std::cerr << compat::format("Cannot decrypt message from {}: {}\n",
                                        envelope.sender_id(), plaintext.UnwrapErr().message);
            return true;
        }
        proto::storage::InboxMessage inbox;
        inbox.set_id(compat::format("{}:{}:{}", envelope.timestamp(), envelope.sender_id(),
                                    Encoding::GenerateUuid().substr(0, 8)));
        inbox.set_sender_id(envelope.sender_id());
        inbox.set_timestamp(envelope.timestamp());
        inbox.set_plaintext(Encoding::ToText(plaintext.Unwrap()));
        *inbox.mutable_envelope() = envelope;
        if (auto saved = store->SaveInboxMessage(inbox); saved.IsErr()) {
            std::cerr << compat::format("Cannot save message to the inbox: {}\n", saved.UnwrapErr().message);
        }
        std::cout << compat::format("[{}] {}\n", envelope.sender_id(), inbox.plaintext()) << std::flush;
        return true;
    });
    Require(listened, "Listener stopped");
    return EXIT_SUCCESS;
}

int ClientInboxCommand(const Arguments& args) {
    const uint32_t limit = ParseNumber<uint32_t>(
        args.Option("limit").value_or(std::to_string(kDefaultInboxLimit)), "limit");
    std::optional<int64_t> since;
    if (auto text = args.Option("since")) {
        since = ParseNumber<int64_t>(*text, "since");
    }
    const auto store = OpenStore(args);
    auto messages = Require(store->ListInboxMessages(), "Cannot read the inbox");
    if (since) {
        messages.erase(std::remove_if(messages.begin(), messages.end(),
                                      [&](const auto& message) { return message.timestamp() <= *since; }),
                       messages.end());
    }
    if (messages.size() > limit) {
        messages.erase(messages.begin(), messages.end() - limit);
    }

    if (args.Flag("json")) {
        std::string out = "[";
        for (size_t i = 0; i < messages.size(); ++i) {
            out += i == 0 ? "\n" : ",\n";
            out += PrettyJson(messages[i]);
        }
        out += messages.empty() ? "]" : "\n]";
        WriteText(std::nullopt, out);
        return EXIT_SUCCESS;
    }
    if (messages.empty()) {
        std::cout << "Inbox empty.\n";
        return EXIT_SUCCESS;
    }
    for (const auto& message : messages) {
        std::cout << compat::format("[{}] {}: {}\n", FormatTimestamp(message.timestamp()),
                                    message.sender_id(), message.plaintext());
    }
    return EXIT_SUCCESS;
}

int AdminDiagnosticsCommand(const Arguments& args) {
    const auto client = Connect(args);
    const auto snapshot = Require(client.Diagnostics(), "Diagnostics failed");
    if (args.Flag("json")) {
        WriteText(std::nullopt, PrettyJson(snapshot));
        return EXIT_SUCCESS;
    }
    const auto& histogram = snapshot.queue_depth_histogram();
    const auto bucket = [&](const std::string& key) {
        const auto it = histogram.find(key);
        return it == histogram.end() ? 0u : it->second;
    };
    const auto& counts = snapshot.counts();
    std::cout << compat::format("Uptime: {}\n", FormatDuration(snapshot.uptime_sec()))
              << compat::format("DB: {}\n", snapshot.db_path())
              << compat::format("Counts: users={} prekeys={} queued={} active_ws={}\n",
                                counts.users(), counts.prekeys(), counts.queued_messages(),
                                counts.active_connections())
              << compat::format("Queue histogram: 0={} 1-5={} 6-20={} 21+={}\n",
                                bucket("0"), bucket("1-5"), bucket("6-20"), bucket("21+"));
    if (!snapshot.has_metrics()) {
        std::cout << "Metrics: none (no host sample pushed)\n";
        return EXIT_SUCCESS;
    }
    const auto& metrics = snapshot.metrics();
    std::string load;
    for (const double value : metrics.load()) {
        load += compat::format("{}{:.2f}", load.empty() ? "" : " ", value);
    }
    std::cout << compat::format("Metrics: cpu={:.1f}% mem={:.1f}% swap={:.1f}% net_in={} net_out={}\n",
                                metrics.cpu_pct(), metrics.mem_pct(), metrics.swap_pct(),
                                metrics.net_in_bytes(), metrics.net_out_bytes())
              << compat::format("Load: {} updated_at={}\n", load, FormatTimestamp(metrics.updated_at()));
    return EXIT_SUCCESS;
}

void PrintUsage(std::ostream& out) {
    out << "Usage: courier [--db <path>] [--passphrase <p>] [--server <url>] <command>\n"
           "\n"
           "Local commands:\n"
           "  init --id <id> [--device <n>]\n"
           "  identity show\n"
           "  prekey generate [--count <n>]\n"
           "  bundle export --out <file>\n"
           "  session init --their-bundle <file>\n"
           "  encrypt --to <id> [--in <file>] [--out <file>]\n"
           "  decrypt [--in <file>] [--out <file>]\n"
           "\n"
           "Relay commands:\n"
           "  client register --id <id>\n"
           "  client prekeys upload\n"
           "  client prekeys fetch --id <id> [--out <file>]\n"
           "  client send --to <id> [--in <file>]\n"
           "  client listen --id <id>\n"
           "  client inbox [--limit <n>] [--since <epoch-ms>] [--json]\n"
           "  admin diagnostics [--json]\n"
           "\n"
           "The passphrase falls back to $COURIER_PASSPHRASE, then a prompt.\n";
}

int Dispatch(const Arguments& args) {
    const std::string command = args.Word(0);
    const std::string sub = args.Word(1);

    if (command == "init") {
        return InitCommand(args);
    }
    if (command == "identity" && sub == "show") {
        return IdentityShowCommand(args);
    }
    if (command == "prekey" && sub == "generate") {
        return PreKeyGenerateCommand(args);
    }
    if (command == "bundle" && sub == "export") {
        return BundleExportCommand(args);
    }
    if (command == "session" && sub == "init") {
        return SessionInitCommand(args);
    }
    if (command == "encrypt") {
        return EncryptCommand(args);
    }
    if (command == "decrypt") {
        return DecryptCommand(args);
    }
    if (command == "client") {
        if (sub == "register") {
            return ClientRegisterCommand(args);
        }
        if (sub == "prekeys" && args.Word(2) == "upload") {
            return ClientPreKeysUploadCommand(args);
        }
        if (sub == "prekeys" && args.Word(2) == "fetch") {
            return ClientPreKeysFetchCommand(args);
        }
        if (sub == "send") {
            return ClientSendCommand(args);
        }
        if (sub == "listen") {
            return ClientListenCommand(args);
        }
        if (sub == "inbox") {
            return ClientInboxCommand(args);
        }
    }
    if (command == "admin" && sub == "diagnostics") {
        return AdminDiagnosticsCommand(args);
    }
    PrintUsage(std::cerr);
    return EXIT_FAILURE;
}

}

int Run(const int argc, char** argv) {
    const auto args = Arguments::Parse(argc, argv);
    if (args.Flag("help") || args.Words().empty()) {
        PrintUsage(args.Flag("help") ? std::cout : std::cerr);
        return args.Flag("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    spdlog::set_level(args.Flag("verbose") ? spdlog::level::debug : spdlog::level::warn);
    Require(protocol::crypto::SodiumInterop::Initialize(), "Cannot initialize libsodium");
    return Dispatch(args);
}

}

int main(int argc, char** argv) {
    try {
        return courier::cli::Run(argc, argv);
    } catch (const courier::cli::CommandError& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal: " << ex.what() << '\n';
        return 2;
    }
}
