#include "todo_store.hpp"
#include "file_io.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

static fs::path scratch_dir() {
  fs::path d = fs::temp_directory_path() / ("mtodo_store_test_" + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void test_parse() {
  std::vector<TodoItem> items; std::string msg;
  assert(parse_todos(R"([{"status":"Completed","todo":"a","info":"b"},{"status":"Todo","todo":"c","info":""}])", items, msg));
  assert(items.size() == 2);
  assert(items[0].status == Status::Completed && items[0].todo == "a" && items[0].info == "b");
  assert(items[1].status == Status::Todo && items[1].todo == "c");

  assert(parse_todos("[]", items, msg) && items.empty());
  assert(!parse_todos("{\"todo\":1}", items, msg));
  assert(!parse_todos("[{\"status\":\"Todo\"", items, msg));
  assert(!parse_todos(R"([{"status":"Later","todo":"a","info":""}])", items, msg));
  assert(items.empty());
  assert(!parse_todos(R"([{"status":"Todo","todo":3,"info":""}])", items, msg));
  assert(!parse_todos(R"([{"status":"Todo","info":""}])", items, msg));
  assert(!msg.empty());
}

static void test_serialize() {
  std::vector<TodoItem> items{{Status::Todo, "buy \"milk\"", "2l"}, {Status::Completed, "x", ""}};
  std::string s = serialize_todos(items);
  assert(s.find("\"status\":\"Todo\"") != std::string::npos);
  assert(s.find("\"status\":\"Completed\"") != std::string::npos);
  std::vector<TodoItem> back; std::string msg;
  assert(parse_todos(s, back, msg));
  assert(back.size() == 2 && back[0].todo == "buy \"milk\"" && back[0].info == "2l");
}

static void test_read_write() {
  fs::path dir = scratch_dir();
  fs::path file = dir / "nested" / "todos.json";
  std::vector<TodoItem> items; std::string msg;

  assert(read_todos(file, items, msg));
  assert(items.empty());

  std::vector<TodoItem> src{{Status::Todo, "write tests", "for the store"}};
  assert(write_todos(file, src, msg));
  assert(fs::exists(file));
  assert(!fs::exists(fs::path(file.string() + ".tmp")));
  assert(read_todos(file, items, msg));
  assert(items.size() == 1 && items[0].todo == "write tests" && items[0].info == "for the store");

  std::string garbage = "not json";
  assert(write_file_atomic(file, garbage, msg));
  assert(!read_todos(file, items, msg));
  assert(items.empty());

  std::vector<std::string> lines;
  assert(write_file_atomic(dir / "rc", "set wrap=char\r\n# note\n\nq", msg));
  assert(mmap_readlines(dir / "rc", lines, msg));
  assert(lines.size() == 4 && lines[0] == "set wrap=char" && lines[2].empty() && lines[3] == "q");
  assert(!mmap_readlines(dir / "missing", lines, msg));

  fs::remove_all(dir);
}

static void test_default_path() {
  std::string msg;
  ::setenv("XDG_DATA_HOME", "/tmp/xdg", 1);
  auto p = default_data_path(msg);
  assert(p && *p == fs::path("/tmp/xdg/todo/todos.json"));
  ::unsetenv("XDG_DATA_HOME");
  ::setenv("HOME", "/home/someone", 1);
  p = default_data_path(msg);
  assert(p && *p == fs::path("/home/someone/.local/share/todo/todos.json"));
  ::unsetenv("HOME");
  p = default_data_path(msg);
  assert(!p && msg == "no home directory found");
}

int main() {
  test_parse();
  test_serialize();
  test_read_write();
  test_default_path();
  return 0;
}
