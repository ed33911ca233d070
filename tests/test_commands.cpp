#include "cmd_registry.hpp"
#include "input.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_parse() {
  std::string name;
  std::vector<std::string> args;
  assert(CommandRegistry::parse(":w  out.json", name, args));
  assert(name == "w");
  assert(args.size() == 1 && args[0] == "out.json");
  assert(CommandRegistry::parse("  set wrap=char datafile=x", name, args));
  assert(name == "set" && args.size() == 2 && args[1] == "datafile=x");
  assert(!CommandRegistry::parse(":   ", name, args));
  assert(!CommandRegistry::parse("", name, args));
}

static void test_run_line() {
  CommandRegistry reg;
  int calls = 0;
  reg.add("q", [&](const std::vector<std::string>&, std::string&) { calls++; return true; });
  reg.add("fail", [](const std::vector<std::string>& args, std::string& msg) {
    msg = "failed with " + std::to_string(args.size());
    return false;
  });
  reg.alias("quit", "q");
  reg.alias("nothing", "missing");
  assert(reg.contains("quit"));
  assert(!reg.contains("nothing"));

  std::string msg;
  assert(reg.run_line(":q", msg) && calls == 1);
  assert(reg.run_line("quit", msg) && calls == 2);
  assert(reg.run_line("", msg) && msg.empty());
  assert(!reg.run_line("fail a b", msg));
  assert(msg == "failed with 2");
  assert(!reg.run_line("bogus", msg));
  assert(msg == "not an editor command: bogus");
}

static void test_count_prefix() {
  Input in;
  assert(!in.has_count());
  assert(in.take_count() == 1);
  assert(!in.consume_digit('0'));
  assert(in.consume_digit('1'));
  assert(in.consume_digit('0'));
  assert(in.has_count());
  assert(in.take_count() == 10);
  assert(!in.has_count());
  assert(in.take_count(0) == 0);
  assert(!in.consume_digit('x'));
}

static void test_count_saturates() {
  Input in;
  for (int i = 0; i < 25; ++i) assert(in.consume_digit('9'));
  assert(in.take_count() == Input::kMaxCount);
  in.consume_digit('1');
  for (int i = 0; i < 30; ++i) in.consume_digit('0');
  assert(in.take_count() == Input::kMaxCount);
}

static void test_double_key() {
  Input in;
  assert(!in.consume_double('d', 'd'));
  assert(in.pending_op());
  assert(in.consume_double('d', 'd'));
  assert(!in.pending_op());

  assert(!in.consume_double('d', 'd'));
  assert(!in.consume_double('j', 'd'));
  assert(!in.pending_op());
  assert(!in.consume_double('d', 'd'));

  in.consume_digit('3');
  in.reset();
  assert(!in.pending_op());
  assert(!in.has_count());
}

int main() {
  test_parse();
  test_run_line();
  test_count_prefix();
  test_count_saturates();
  test_double_key();
  return 0;
}
