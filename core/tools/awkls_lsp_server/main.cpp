// awkls LSP server (stdio JSON-RPC)
//
// Thin transport around awkls::Workspace and awkls::lsp::LanguageService.
// Messages use Content-Length framing. Include files are read between
// messages, so the analysis never sees a read complete mid-parse.
//
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "awkls/basic/log.hpp"
#include "awkls/basic/uri.hpp"
#include "awkls/config/settings.hpp"
#include "awkls/lsp/language_service.hpp"
#include "awkls/lsp/local_file_system.hpp"
#include "awkls/sema/workspace.hpp"

#include <spdlog/spdlog.h>

using nlohmann::json;

namespace
{

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

std::optional<json> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    const std::string_view sv(line);
    if (starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  try {
    return json::parse(body);
  } catch (const json::parse_error & e) {
    spdlog::warn("ignoring malformed message: {}", e.what());
    return std::nullopt;
  }
}

int lsp_severity(awkls::Severity s)
{
  // LSP DiagnosticSeverity: 1 Error, 2 Warning, 3 Information, 4 Hint
  return static_cast<int>(s) + 1;
}

int completion_kind(std::string_view s)
{
  // LSP CompletionItemKind (subset)
  if (s == "Function") return 3;
  if (s == "Variable") return 6;
  return 1;  // Text
}

json position_from_params(const json & params, awkls::Position & pos)
{
  const auto p = params.value("position", json::object());
  pos.line = p.value<uint32_t>("line", 0U);
  pos.character = p.value<uint32_t>("character", 0U);
  return params.value("textDocument", json::object());
}

/// Writes textDocument/publishDiagnostics notifications
class LspDiagnosticSink : public awkls::DiagnosticSink
{
public:
  void publish(const std::string & uri, const std::vector<awkls::Diagnostic> & diagnostics) override
  {
    json items = json::array();
    for (const auto & d : diagnostics) {
      json item;
      item["range"] = json{
        {"start", json{{"line", d.range.start.line}, {"character", d.range.start.character}}},
        {"end", json{{"line", d.range.end.line}, {"character", d.range.end.character}}}};
      item["severity"] = lsp_severity(d.severity);
      item["message"] = d.message;
      item["source"] = "awk";
      if (!d.code.empty()) {
        item["code"] = d.code;
      }
      items.push_back(std::move(item));
    }

    json notif;
    notif["jsonrpc"] = "2.0";
    notif["method"] = "textDocument/publishDiagnostics";
    notif["params"] = json{{"uri", uri}, {"diagnostics", std::move(items)}};
    write_message(notif);
  }
};

json symbol_information(const json & s, const std::string & default_uri)
{
  return json{
    {"name", s.value("name", "")},
    {"kind", 12},  // Function
    {"location", json{{"uri", s.value("uri", default_uri)}, {"range", s.at("range")}}}};
}

}  // namespace

int main()
{
  try {
    const char * level_env = std::getenv("AWKLS_LOG_LEVEL");
    auto logger = awkls::init_logging(
      level_env != nullptr ? awkls::parse_log_level(level_env) : spdlog::level::info);

    awkls::lsp::LocalFileSystem file_system;
    LspDiagnosticSink sink;
    awkls::Workspace workspace(file_system, sink, awkls::default_settings(), logger);
    const awkls::lsp::LanguageService service(workspace);

    auto drain_reads = [&]() {
      while (file_system.has_pending()) {
        file_system.poll();
      }
    };

    auto apply_settings = [&](const json & config) {
      const auto result = awkls::settings_from_json(config, workspace.settings());
      if (!result.success) {
        logger->warn("invalid configuration: {}", result.error);
        return;
      }
      workspace.update_settings(result.settings);
      drain_reads();
    };

    bool running = true;
    while (running) {
      const auto msg_opt = read_message();
      if (!msg_opt) {
        if (!std::cin.good()) {
          break;
        }
        continue;
      }

      const json & msg = *msg_opt;
      const std::string method = msg.value("method", "");
      const bool is_request = msg.contains("id");

      auto respond = [&](const json & result) {
        json resp;
        resp["jsonrpc"] = "2.0";
        resp["id"] = msg["id"];
        resp["result"] = result;
        write_message(resp);
      };

      auto respond_error = [&](int code, std::string message) {
        json resp;
        resp["jsonrpc"] = "2.0";
        resp["id"] = msg["id"];
        resp["error"] = json{{"code", code}, {"message", std::move(message)}};
        write_message(resp);
      };

      const json params = msg.value("params", json::object());

      if (method == "initialize" && is_request) {
        // Project settings first, then whatever the client passes along
        if (params.contains("rootUri") && params["rootUri"].is_string()) {
          if (auto root = awkls::file_uri_to_path(params["rootUri"].get<std::string>())) {
            if (auto config = awkls::find_settings_file(*root)) {
              const auto result = awkls::load_settings_file(*config);
              if (result.success) {
                workspace.update_settings(result.settings);
              } else {
                logger->warn("{}: {}", config->string(), result.error);
              }
            }
          }
        }
        if (params.contains("initializationOptions") && params["initializationOptions"].is_object()) {
          apply_settings(params["initializationOptions"]);
        }

        json caps;
        caps["textDocumentSync"] = 1;  // Full
        caps["hoverProvider"] = true;
        caps["definitionProvider"] = true;
        caps["referencesProvider"] = true;
        caps["documentSymbolProvider"] = true;
        caps["workspaceSymbolProvider"] = true;
        caps["completionProvider"] = json{{"resolveProvider", false}};
        caps["signatureHelpProvider"] = json{{"triggerCharacters", json::array({"(", ","})}};

        respond(json{{"capabilities", caps}, {"serverInfo", json{{"name", "awkls"}}}});
        continue;
      }

      if (method == "initialized") {
        continue;
      }

      if (method == "shutdown" && is_request) {
        respond(nullptr);
        continue;
      }

      if (method == "exit") {
        running = false;
        continue;
      }

      if (method == "textDocument/didOpen") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (!uri.empty()) {
          workspace.change_document(uri, td.value("text", ""));
          drain_reads();
        }
        continue;
      }

      if (method == "textDocument/didChange") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        const auto changes = params.value("contentChanges", json::array());
        if (uri.empty() || !changes.is_array() || changes.empty()) {
          continue;
        }
        const auto & last = changes.back();
        if (!last.is_object() || !last.contains("text") || !last["text"].is_string()) {
          continue;
        }
        workspace.change_document(uri, last["text"].get<std::string>());
        drain_reads();
        continue;
      }

      if (method == "textDocument/didClose") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (!uri.empty()) {
          workspace.close_document(uri);
          drain_reads();
        }
        continue;
      }

      if (method == "workspace/didChangeConfiguration") {
        if (params.contains("settings") && params["settings"].is_object()) {
          apply_settings(params["settings"]);
        }
        continue;
      }

      if (method == "textDocument/hover" && is_request) {
        awkls::Position pos;
        const auto td = position_from_params(params, pos);
        const json hj = json::parse(service.hover_json(td.value("uri", ""), pos));
        const auto & contents = hj["contents"];
        if (!contents.is_array() || contents.empty()) {
          respond(nullptr);
          continue;
        }
        std::string text;
        for (const auto & c : contents) {
          if (!text.empty()) {
            text += "\n\n";
          }
          text += c.get<std::string>();
        }
        json out;
        out["contents"] = json{{"kind", "plaintext"}, {"value", text}};
        if (hj["range"].is_object()) {
          out["range"] = hj["range"];
        }
        respond(out);
        continue;
      }

      if (method == "textDocument/definition" && is_request) {
        awkls::Position pos;
        const auto td = position_from_params(params, pos);
        const json dj = json::parse(service.definition_json(td.value("uri", ""), pos));
        respond(dj["locations"]);
        continue;
      }

      if (method == "textDocument/references" && is_request) {
        awkls::Position pos;
        const auto td = position_from_params(params, pos);
        const auto context = params.value("context", json::object());
        const json rj = json::parse(service.references_json(
          td.value("uri", ""), pos, context.value("includeDeclaration", false)));
        respond(rj["locations"]);
        continue;
      }

      if (method == "textDocument/completion" && is_request) {
        awkls::Position pos;
        const auto td = position_from_params(params, pos);
        const json cj = json::parse(service.completion_json(td.value("uri", ""), pos));
        json items = json::array();
        for (const auto & it0 : cj["items"]) {
          json item;
          item["label"] = it0.value("label", "");
          item["kind"] = completion_kind(it0.value("kind", ""));
          if (it0.contains("detail")) {
            item["detail"] = it0["detail"];
          }
          if (it0.contains("documentation")) {
            item["documentation"] = it0["documentation"];
          }
          items.push_back(std::move(item));
        }
        respond(json{{"isIncomplete", false}, {"items", items}});
        continue;
      }

      if (method == "textDocument/documentSymbol" && is_request) {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        const json sj = json::parse(service.document_symbols_json(uri));
        json out = json::array();
        for (const auto & s0 : sj["symbols"]) {
          out.push_back(symbol_information(s0, uri));
        }
        respond(out);
        continue;
      }

      if (method == "workspace/symbol" && is_request) {
        const json sj = json::parse(service.workspace_symbols_json(params.value("query", "")));
        json out = json::array();
        for (const auto & s0 : sj["symbols"]) {
          out.push_back(symbol_information(s0, ""));
        }
        respond(out);
        continue;
      }

      if (method == "textDocument/signatureHelp" && is_request) {
        awkls::Position pos;
        const auto td = position_from_params(params, pos);
        const json sj = json::parse(service.signature_json(td.value("uri", ""), pos));
        const auto & sig = sj["signature"];
        if (!sig.is_object()) {
          respond(nullptr);
          continue;
        }
        json parameters = json::array();
        for (const auto & p : sig["parameters"]) {
          parameters.push_back(json{{"label", p}});
        }
        respond(json{
          {"signatures", json::array({json{{"label", sig["label"]}, {"parameters", parameters}}})},
          {"activeSignature", 0},
          {"activeParameter", sig["activeParameter"]}});
        continue;
      }

      // Unknown method
      if (is_request) {
        respond_error(-32601, "Method not found");
      }
    }

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "awkls_lsp_server: fatal error: " << e.what() << "\n";
    return 1;
  }
}
