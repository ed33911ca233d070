#include "app.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include "config.hpp"
#include "file_io.hpp"
#include "todo_store.hpp"

static inline bool is_printable(int ch) { return ch >= 32 && ch <= 126; }

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

App::App(ITerminal& term, const AppOptions& opts)
  : term_(term), wrapping_(MTODO_DEFAULT_WRAP_MODE) {
  register_commands();
  if (opts.load_rc) load_rc();
  if (opts.data_file) data_path_ = opts.data_file;
  if (!data_path_) {
    std::string m;
    data_path_ = default_data_path(m);
    if (!data_path_) message_ = m;
  }
  todo_field_.set_wrapping(wrapping_);
  info_field_.set_wrapping(wrapping_);
  load_data();
}

void App::run() {
  while (!should_quit_) {
    render();
    int ch = 0;
    if (!term_.read_key(ch)) break;
    handle_input(ch);
  }
}

void App::render() {
  RenderState st;
  st.list = &todo_list_;
  st.vp = &vp_;
  st.view = &view_;
  st.todo_field = &todo_field_;
  st.info_field = &info_field_;
  st.command_active = command_active_;
  st.cmdline = cmdline_;
  st.message = message_;
  renderer_.render(term_, st);
}

void App::load_data() {
  if (!data_path_) return;
  std::vector<TodoItem> items;
  std::string m;
  if (!read_todos(*data_path_, items, m)) {
    load_failed_ = true;
    message_ = m;
    return;
  }
  load_failed_ = false;
  todo_list_.assign(std::move(items));
  modified_ = false;
  message_ = m;
}

bool App::save(bool force) {
  if (!data_path_) { message_ = "no data file, use :set datafile=<path>"; return false; }
  if (load_failed_ && !force) { message_ = "data file did not load, use :w! to overwrite it"; return false; }
  std::string m;
  if (!write_todos(*data_path_, todo_list_.items(), m)) { message_ = m; return false; }
  load_failed_ = false;
  modified_ = false;
  message_ = m;
  return true;
}

void App::set_data_path(const std::filesystem::path& p) {
  if (data_path_ && *data_path_ == p) return;
  data_path_ = p;
  // a new target has nothing on disk to protect yet
  load_failed_ = false;
}

bool App::quit(bool force) {
  if (!force && modified_) { message_ = "have unsaved changes, use :q! or :w"; return false; }
  should_quit_ = true;
  return true;
}

void App::register_commands() {
  using Args = std::vector<std::string>;
  registry_.add("w", [this](const Args& args, std::string&) {
    if (!args.empty()) set_data_path(args[0]);
    return save(false);
  });
  registry_.add("w!", [this](const Args& args, std::string&) {
    if (!args.empty()) set_data_path(args[0]);
    return save(true);
  });
  registry_.add("q", [this](const Args&, std::string&) { return quit(false); });
  registry_.add("q!", [this](const Args&, std::string&) { return quit(true); });
  registry_.add("wq", [this](const Args&, std::string&) { return save(false) && quit(true); });
  registry_.alias("x", "wq");
  registry_.add("set", [this](const Args& args, std::string& msg) {
    if (args.empty()) {
      msg = std::string("wrap=") + std::string(wrap_mode_name(wrapping_)) +
            " datafile=" + (data_path_ ? data_path_->string() : "");
      return true;
    }
    for (const auto& a : args) {
      if (!set_option(a, msg)) return false;
    }
    return true;
  });
}

bool App::set_option(const std::string& opt, std::string& msg) {
  size_t eq = opt.find('=');
  std::string key = opt.substr(0, eq);
  std::string val = eq == std::string::npos ? std::string() : opt.substr(eq + 1);
  if (key == "wrap" || key == "nowrap") {
    WrapMode m = WrapMode::None;
    if (key == "wrap" && !parse_wrap_mode(val, m)) { msg = "unknown wrap mode: " + val; return false; }
    wrapping_ = m;
    todo_field_.set_wrapping(m);
    info_field_.set_wrapping(m);
    return true;
  }
  if (key == "datafile") {
    if (val.empty()) { msg = "datafile needs a path"; return false; }
    set_data_path(val);
    return true;
  }
  msg = "unknown option: " + key;
  return false;
}

bool App::execute_command_line(const std::string& line) {
  std::string m;
  bool ok = registry_.run_line(line, m);
  if (!m.empty()) message_ = m;
  return ok;
}

void App::load_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return;
  std::error_code ec;
  auto p = std::filesystem::path(home) / MTODO_RC_FILE;
  if (!std::filesystem::exists(p, ec)) return;
  std::vector<std::string> lines; std::string m;
  if (!mmap_readlines(p, lines, m)) { message_ = m; return; }
  for (const auto& raw : lines) {
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    execute_command_line(s);
  }
}

void App::handle_input(int ch) {
  if (ch == keys::Unknown || ch == keys::Resize) return;
  if (command_active_) { handle_command_input(ch); return; }
  if (auto* ev = std::get_if<EditView>(&view_)) { handle_edit_input(*ev, ch); return; }
  handle_list_input(ch);
}

void App::handle_command_input(int ch) {
  switch (ch) {
    case keys::Esc: command_active_ = false; cmdline_.clear(); break;
    case keys::Enter: {
      command_active_ = false;
      std::string line = cmdline_;
      cmdline_.clear();
      execute_command_line(line);
    } break;
    case keys::Backspace:
      if (cmdline_.empty()) command_active_ = false;
      else cmdline_.pop_back();
      break;
    default:
      if (is_printable(ch)) cmdline_.push_back(static_cast<char>(ch));
      break;
  }
}

void App::handle_list_input(int ch) {
  if (input_.consume_digit(ch)) return;
  if (ch != 'd') {
    input_.consume_double(ch, 'd');
    if (ch != 'j' && ch != 'k' && ch != keys::Down && ch != keys::Up) input_.reset();
  }
  switch (ch) {
    case 'q':
      if (modified_ && !save(false)) break;
      quit(false);
      break;
    case 'j': case keys::Down: {
      size_t n = std::min(input_.take_count(), todo_list_.size()); while (n--) todo_list_.select_next();
    } break;
    case 'k': case keys::Up: {
      size_t n = std::min(input_.take_count(), todo_list_.size()); while (n--) todo_list_.select_previous();
    } break;
    case 'g': todo_list_.select_first(); break;
    case 'G': todo_list_.select_last(); break;
    case 'x':
      if (todo_list_.toggle_status()) modified_ = true;
      break;
    case 'a': open_editor(std::nullopt); break;
    case 'e': case keys::Enter:
      if (auto sel = todo_list_.selected()) open_editor(*sel);
      break;
    case 'd':
      if (input_.consume_double(ch, 'd')) {
        size_t n = input_.take_count();
        auto sel = todo_list_.selected();
        if (!sel) break;
        size_t idx = *sel;
        size_t removed = 0;
        // like dd in an editor: delete downwards, land on the item after the block
        while (n-- && todo_list_.remove_selected()) {
          removed++;
          if (idx >= todo_list_.size()) break;
          todo_list_.select(idx);
        }
        if (removed > 0) { modified_ = true; message_ = std::to_string(removed) + " deleted"; }
      }
      break;
    case ':': command_active_ = true; cmdline_.clear(); break;
    default: break;
  }
}

void App::open_editor(std::optional<size_t> target) {
  std::string m;
  std::string todo, info;
  if (target) {
    if (*target >= todo_list_.size()) return;
    todo = todo_list_.at(*target).todo;
    info = todo_list_.at(*target).info;
  }
  if (!todo_field_.set_input(todo, m) || !info_field_.set_input(info, m)) {
    message_ = "cannot edit: " + m;
    return;
  }
  todo_field_.move_end();
  info_field_.move_end();
  EditView ev;
  ev.target = target;
  ev.mode = target ? EditMode::Normal : EditMode::Insert;
  ev.focus = Field::Todo;
  view_ = ev;
}

void App::commit_edit(const EditView& ev) {
  std::string todo = todo_field_.text();
  std::string info = info_field_.text();
  if (ev.target) {
    if (*ev.target >= todo_list_.size()) return;
    TodoItem item = todo_list_.at(*ev.target);
    if (item.todo == todo && item.info == info) return;
    item.todo = std::move(todo);
    item.info = std::move(info);
    todo_list_.replace(*ev.target, std::move(item));
    modified_ = true;
    return;
  }
  if (todo.empty()) { message_ = "empty todo discarded"; return; }
  todo_list_.add(TodoItem{Status::Todo, std::move(todo), std::move(info)});
  modified_ = true;
}

void App::close_editor() {
  view_ = ListView{};
}

InputField& App::focused(const EditView& ev) {
  return ev.focus == Field::Todo ? todo_field_ : info_field_;
}

void App::toggle_focus(EditView& ev) {
  ev.focus = ev.focus == Field::Todo ? Field::Info : Field::Todo;
}

void App::handle_edit_input(EditView& ev, int ch) {
  if (ev.mode == EditMode::Insert) handle_edit_insert_input(ev, ch);
  else handle_edit_normal_input(ev, ch);
}

// close_editor() replaces view_, so ev must not be touched after it
void App::handle_edit_normal_input(EditView& ev, int ch) {
  InputField& f = focused(ev);
  switch (ch) {
    case 'q': commit_edit(ev); close_editor(); return;
    case keys::Esc: close_editor(); message_ = "edit discarded"; return;
    case 'i': ev.mode = EditMode::Insert; break;
    case 'a': f.move_right(); ev.mode = EditMode::Insert; break;
    case 'A': f.move_end(); ev.mode = EditMode::Insert; break;
    case 'I': f.move_home(); ev.mode = EditMode::Insert; break;
    case keys::Tab: case 'j': case 'k': case keys::Up: case keys::Down: toggle_focus(ev); break;
    case 'h': case keys::Left: f.move_left(); break;
    case 'l': case keys::Right: f.move_right(); break;
    case '0': case keys::Home: f.move_home(); break;
    case '$': case keys::End: f.move_end(); break;
    case 'x': case keys::Delete: f.delete_char(); break;
    case ':': command_active_ = true; cmdline_.clear(); break;
    default: break;
  }
}

void App::handle_edit_insert_input(EditView& ev, int ch) {
  InputField& f = focused(ev);
  switch (ch) {
    case keys::Esc: ev.mode = EditMode::Normal; break;
    case keys::Enter: case keys::Tab: toggle_focus(ev); break;
    case keys::Backspace: f.backspace(); break;
    case keys::Delete: f.delete_char(); break;
    case keys::Left: f.move_left(); break;
    case keys::Right: f.move_right(); break;
    case keys::Home: f.move_home(); break;
    case keys::End: f.move_end(); break;
    default:
      if (is_printable(ch)) f.insert_char(ch);
      break;
  }
}
