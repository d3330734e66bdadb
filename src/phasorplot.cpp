#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#ifdef WIN32
#include <readline/readline.h>
#include <readline/history.h>
#else
#include <linenoise.h>
#endif
#include <fmt/format.h>
#include "commands.hpp"
#include "parse_commands.hpp"
#include "session.hpp"
#include "strings.hpp"

namespace
{
using namespace phasorplot;

constexpr auto prompt = "phasor> ";
constexpr int history_length = 100;

std::filesystem::path data_directory()
{
  if (const auto *xdg = std::getenv("XDG_DATA_HOME"); xdg != nullptr)
  {
    return std::filesystem::path(xdg) / "phasorplot";
  }
  if (const auto *home = std::getenv("HOME"); home != nullptr)
  {
    return std::filesystem::path(home) / ".local" / "share" / "phasorplot";
  }
  fmt::println("$HOME and $XDG_DATA_HOME not set. Using working directory instead.");
  return std::filesystem::current_path();
}

// Line editing with a history file that is loaded on construction and written back on
// destruction.
class line_reader final
{
public:
  explicit line_reader(std::filesystem::path history_file) : _history_file(std::move(history_file))
  {
    const auto path = _history_file.string();
#ifdef WIN32
    using_history();
    stifle_history(history_length);
    read_history(path.c_str());
#else
    linenoiseHistorySetMaxLen(history_length);
    linenoiseHistoryLoad(path.c_str());
#endif
  }

  line_reader(const line_reader &) = delete;
  line_reader &operator=(const line_reader &) = delete;

  ~line_reader()
  {
    const auto path = _history_file.string();
#ifdef WIN32
    write_history(path.c_str());
#else
    linenoiseHistorySave(path.c_str());
#endif
  }

  // nullopt at end of input
  std::optional<std::string> next()
  {
#ifdef WIN32
    auto line = std::unique_ptr<char, decltype(&std::free)>(readline(prompt), &std::free);
#else
    auto line = std::unique_ptr<char, decltype(&linenoiseFree)>(linenoise(prompt), &linenoiseFree);
#endif
    if (line == nullptr)
    {
      return std::nullopt;
    }
    auto text = std::string(line.get());
    if (!trim(text).empty())
    {
#ifdef WIN32
      add_history(text.c_str());
#else
      linenoiseHistoryAdd(text.c_str());
#endif
    }
    return text;
  }

private:
  std::filesystem::path _history_file;
};
} // namespace

int main()
{
  const auto data_dir = data_directory();
  if (auto ec = std::error_code(); !std::filesystem::create_directories(data_dir, ec) && ec)
  {
    fmt::println("error: cannot create {}: {}", data_dir.string(), ec.message());
  }

  auto reader = line_reader(data_dir / "history");
  auto s = session{};
  while (auto line = reader.next())
  {
    if (trim(*line).empty())
    {
      continue;
    }
    auto cmd = parse_command(*line);
    if (!cmd)
    {
      fmt::println("error: {}", cmd.error());
      continue;
    }
    if (is_quit_command(*cmd))
    {
      break;
    }
    if (auto output = execute(s, *cmd); !output)
    {
      fmt::println("error: {}", output.error());
    }
    else if (!output->empty())
    {
      fmt::println("{}", *output);
    }
  }
  return 0;
}
