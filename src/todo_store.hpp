#pragma once
/*
 * TodoStore
 *
 * Purpose: load/save the todo list as a JSON array of
 *          {"status": "Todo"|"Completed", "todo": ..., "info": ...}.
 * Note: a missing file is an empty list, not an error; writes are atomic.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "todo_list.hpp"

// $XDG_DATA_HOME/todo/todos.json, else $HOME/.local/share/todo/todos.json
std::optional<std::filesystem::path> default_data_path(std::string& msg);

bool parse_todos(const std::string& json_text, std::vector<TodoItem>& out, std::string& msg);
std::string serialize_todos(const std::vector<TodoItem>& items);

bool read_todos(const std::filesystem::path& path, std::vector<TodoItem>& out, std::string& msg);
bool write_todos(const std::filesystem::path& path, const std::vector<TodoItem>& items, std::string& msg);
