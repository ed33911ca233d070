#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "cmd_registry.hpp"
#include "input.hpp"
#include "input_field.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "todo_list.hpp"
#include "types.hpp"

struct AppOptions {
  std::optional<std::filesystem::path> data_file; // overrides the default data path
  bool load_rc = true;
};

class App {
public:
  App(ITerminal& term, const AppOptions& opts);
  void run();

  void render();
  void handle_input(int ch);
  bool should_quit() const { return should_quit_; }

  const TodoList& todo_list() const { return todo_list_; }
  const ViewState& view() const { return view_; }
  const InputField& todo_field() const { return todo_field_; }
  const InputField& info_field() const { return info_field_; }
  const std::string& message() const { return message_; }
  const std::optional<std::filesystem::path>& data_path() const { return data_path_; }
  WrapMode wrapping() const { return wrapping_; }
  bool modified() const { return modified_; }

  bool execute_command_line(const std::string& line);
  bool save(bool force = false);

private:
  void register_commands();
  bool set_option(const std::string& opt, std::string& msg);
  void load_rc();
  void load_data();

  void handle_list_input(int ch);
  void handle_edit_input(EditView& ev, int ch);
  void handle_edit_normal_input(EditView& ev, int ch);
  void handle_edit_insert_input(EditView& ev, int ch);
  void handle_command_input(int ch);

  void open_editor(std::optional<size_t> target);
  void commit_edit(const EditView& ev);
  void close_editor();
  InputField& focused(const EditView& ev);
  void toggle_focus(EditView& ev);
  bool quit(bool force);
  void set_data_path(const std::filesystem::path& p);

  ITerminal& term_;
  Renderer renderer_;
  CommandRegistry registry_;
  Input input_;
  TodoList todo_list_;
  Viewport vp_;
  ViewState view_ = ListView{};
  InputField todo_field_;
  InputField info_field_;
  WrapMode wrapping_;
  std::optional<std::filesystem::path> data_path_;
  std::string message_;
  std::string cmdline_;
  bool command_active_ = false;
  bool modified_ = false;
  bool load_failed_ = false;
  bool should_quit_ = false;
};
