#include "todo_store.hpp"
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "file_io.hpp"

using json = nlohmann::json;

NLOHMANN_JSON_SERIALIZE_ENUM(Status, {
  {Status::Todo, "Todo"},
  {Status::Completed, "Completed"},
})

void to_json(json& j, const TodoItem& item) {
  j = json{{"status", item.status}, {"todo", item.todo}, {"info", item.info}};
}

void from_json(const json& j, TodoItem& item) {
  j.at("status").get_to(item.status);
  j.at("todo").get_to(item.todo);
  j.at("info").get_to(item.info);
}

std::optional<std::filesystem::path> default_data_path(std::string& msg) {
  std::filesystem::path base;
  const char* xdg = std::getenv("XDG_DATA_HOME");
  if (xdg && *xdg) {
    base = xdg;
  } else {
    const char* home = std::getenv("HOME");
    if (!home || !*home) { msg = "no home directory found"; return std::nullopt; }
    base = std::filesystem::path(home) / ".local" / "share";
  }
  return base / MTODO_DATA_DIR / MTODO_DATA_FILE;
}

bool parse_todos(const std::string& json_text, std::vector<TodoItem>& out, std::string& msg) {
  out.clear();
  try {
    json j = json::parse(json_text);
    if (!j.is_array()) { msg = "todo file is not a json array"; return false; }
    out.reserve(j.size());
    for (const json& el : j) {
      // unknown status strings would otherwise map to Status::Todo
      const json* st = el.is_object() && el.contains("status") ? &el["status"] : nullptr;
      if (!st || !st->is_string() || (*st != "Todo" && *st != "Completed")) {
        msg = "bad todo entry " + std::to_string(out.size()) + ": " + el.dump();
        out.clear();
        return false;
      }
      out.push_back(el.get<TodoItem>());
    }
  } catch (const json::exception& e) {
    out.clear();
    msg = std::string("bad todo file: ") + e.what();
    return false;
  }
  return true;
}

std::string serialize_todos(const std::vector<TodoItem>& items) {
  return json(items).dump();
}

bool read_todos(const std::filesystem::path& path, std::vector<TodoItem>& out, std::string& msg) {
  out.clear();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) { msg = "new list: " + path.string(); return true; }
  std::string text;
  if (!mmap_read_file(path, text, msg)) return false;
  if (!parse_todos(text, out, msg)) return false;
  msg = "loaded " + std::to_string(out.size()) + " todos from " + path.string();
  return true;
}

bool write_todos(const std::filesystem::path& path, const std::vector<TodoItem>& items, std::string& msg) {
  if (!write_file_atomic(path, serialize_todos(items), msg)) return false;
  msg = "saved " + std::to_string(items.size()) + " todos to " + path.string();
  return true;
}
