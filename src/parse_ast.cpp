#include "parse_ast.hpp"
#include "commands.hpp"
#include <lexy/dsl.hpp>
#include <lexy/callback.hpp>
#include <lexy/input/string_input.hpp>
#include <lexy/action/parse.hpp>
#include <lexy_ext/report_error.hpp>
#include <algorithm>
#include <charconv>
#include <limits>

namespace
{
namespace dsl = lexy::dsl;
using namespace phasorplot;
namespace r
{
using lexeme = lexy::string_lexeme<lexy::utf8_char_encoding>;

struct identifier : lexy::token_production
{
  static constexpr auto rule = []
  {
    auto head = dsl::ascii::alpha_underscore;
    auto tail = dsl::ascii::alpha_digit_underscore;
    return dsl::identifier(head, tail);
  }();
  static constexpr auto value = lexy::as_string<std::string>;
};
// same character classes as names, so "phasor2" is never read as the keyword "phasor"
constexpr auto kw_id = dsl::identifier(dsl::ascii::alpha_underscore, dsl::ascii::alpha_digit_underscore);

struct decimal : lexy::token_production
{
  static constexpr auto rule = dsl::peek(dsl::digit<> | dsl::lit_c<'-'>)
                               >> (dsl::opt(dsl::lit_c<'-'>) + dsl::digits<>
                                   + dsl::opt(dsl::period >> dsl::digits<>));
  static constexpr auto value = lexy::noop;
};

struct parsed_decimal : lexy::token_production
{
  static constexpr auto rule = dsl::capture(dsl::p<decimal>);
  static constexpr auto value = lexy::callback<double>(
      [](lexeme s)
      {
        const auto *first = s.data();
        const auto *last = s.data() + s.size();
        double d = 0.0;
        if (auto [ptr, ec] = std::from_chars(first, last, d); ec == std::errc::result_out_of_range)
        {
          // too many digits for a double; underflow can only come from a zero integer part
          const auto negative = *first == '-';
          const auto *int_last = std::find(first, last, '.');
          const auto huge = std::any_of(first, int_last, [](char c) { return c >= '1' && c <= '9'; });
          d = huge ? std::numeric_limits<double>::infinity() : 0.0;
          return negative ? -d : d;
        }
        return d;
      });
};

struct decimal_integer
{
  static constexpr auto rule = dsl::integer<int>(dsl::digits<>);
  static constexpr auto value = lexy::as_integer<int>;
};

struct coordinates
{
  static constexpr auto rule = dsl::twice(dsl::p<parsed_decimal>, dsl::sep(dsl::comma));
  static constexpr auto value = lexy::construct<point>;
};

struct string
{
  static constexpr auto rule = dsl::quoted(-dsl::unicode::control);
  static constexpr auto value = lexy::as_string<std::string>;
};

struct magnitude_directive
{
  static constexpr auto rule = LEXY_KEYWORD("magnitude", kw_id) >> dsl::p<parsed_decimal>;
  static constexpr auto value = lexy::construct<ast::magnitude_arg>;
};

struct angle_directive
{
  static constexpr auto rule = LEXY_KEYWORD("angle", kw_id) >> dsl::p<parsed_decimal>;
  static constexpr auto value = lexy::construct<ast::angle_arg>;
};

struct to_directive
{
  static constexpr auto rule = LEXY_KEYWORD("to", kw_id) >> dsl::p<coordinates>;
  static constexpr auto value = lexy::construct<ast::to_arg>;
};

struct at_directive
{
  static constexpr auto rule = LEXY_KEYWORD("at", kw_id) >> dsl::p<coordinates>;
  static constexpr auto value = lexy::construct<ast::at_arg>;
};

struct start_point
{
  static constexpr auto rule = LEXY_KEYWORD("start", kw_id);
  static constexpr auto value = lexy::constant(endpoint::start);
};

struct end_point
{
  static constexpr auto rule = LEXY_KEYWORD("end", kw_id);
  static constexpr auto value = lexy::constant(endpoint::end);
};

struct from_directive
{
  struct ref_point
  {
    static constexpr auto rule = dsl::p<start_point> | dsl::p<end_point>;
    static constexpr auto value = lexy::forward<endpoint>;
  };

  static constexpr auto rule =
      LEXY_KEYWORD("from", kw_id) >> (dsl::p<identifier> + dsl::opt(dsl::p<ref_point>));
  static constexpr auto value = lexy::callback<ast::from_arg>(
      [](std::string name, lexy::nullopt)
      { return ast::from_arg{std::move(name), endpoint::end}; },
      [](std::string name, endpoint p) { return ast::from_arg{std::move(name), p}; });
};

struct kind_directive
{
  static constexpr auto rule = LEXY_KEYWORD("kind", kw_id) >> dsl::p<identifier>;
  static constexpr auto value = lexy::construct<ast::kind_arg>;
};

struct color_directive
{
  static constexpr auto rule = LEXY_KEYWORD("color", kw_id) >> dsl::p<string>;
  static constexpr auto value = lexy::construct<ast::color_arg>;
};

struct phasor_
{
  static constexpr auto whitespace = dsl::ascii::space;

  struct directives
  {
    static constexpr auto whitespace = dsl::ascii::space;
    static constexpr auto rule = dsl::partial_combination(
        dsl::p<magnitude_directive>, dsl::p<angle_directive>, dsl::p<to_directive>,
        dsl::p<at_directive>, dsl::p<from_directive>, dsl::p<kind_directive>,
        dsl::p<color_directive>);
    static constexpr auto value = lexy::fold_inplace<ast::phasor_command>(
        [] { return ast::phasor_command{}; },
        [](ast::phasor_command &c, ast::magnitude_arg m) { c.magnitude = m.value; },
        [](ast::phasor_command &c, ast::angle_arg a) { c.angle_deg = a.value; },
        [](ast::phasor_command &c, ast::to_arg t) { c.to = t.value; },
        [](ast::phasor_command &c, ast::at_arg a) { c.at = a.value; },
        [](ast::phasor_command &c, ast::from_arg f) { c.from = std::move(f); },
        [](ast::phasor_command &c, ast::kind_arg k) { c.kind = std::move(k.value); },
        [](ast::phasor_command &c, ast::color_arg col) { c.color = std::move(col.value); });
  };

  static constexpr auto rule = dsl::p<identifier> + dsl::p<directives> + dsl::eof;
  static constexpr auto value = lexy::callback<ast::phasor_command>(
      [](std::string name, ast::phasor_command cmd)
      {
        cmd.name = std::move(name);
        return cmd;
      });
};

struct chain_
{
  static constexpr auto whitespace = dsl::ascii::space;

  struct options
  {
    static constexpr auto whitespace = dsl::ascii::space;
    static constexpr auto rule =
        dsl::partial_combination(dsl::p<at_directive>, dsl::p<kind_directive>);
    static constexpr auto value = lexy::fold_inplace<ast::chain_command>(
        [] { return ast::chain_command{}; },
        [](ast::chain_command &c, ast::at_arg a) { c.at = a.value; },
        [](ast::chain_command &c, ast::kind_arg k) { c.kind = std::move(k.value); });
  };

  struct links
  {
    static constexpr auto rule = dsl::list(dsl::p<string>, dsl::sep(dsl::comma));
    static constexpr auto value = lexy::as_list<std::vector<std::string>>;
  };

  static constexpr auto rule = dsl::p<options> + dsl::p<links> + dsl::eof;
  static constexpr auto value = lexy::callback<ast::chain_command>(
      [](ast::chain_command cmd, std::vector<std::string> links)
      {
        cmd.links = std::move(links);
        return cmd;
      });
};

template <template <settings_id> typename parser, typename result>
struct settings_parser
{
  static constexpr auto rule =
      (LEXY_KEYWORD("duplicates", kw_id) >> dsl::p<parser<settings_id::duplicates>>)
      | (LEXY_KEYWORD("kind", kw_id) >> dsl::p<parser<settings_id::kind>>)
      | (LEXY_KEYWORD("labeloffset", kw_id) >> dsl::p<parser<settings_id::label_offset>>)
      | (LEXY_KEYWORD("margin", kw_id) >> dsl::p<parser<settings_id::margin>>)
      | (LEXY_KEYWORD("minmargin", kw_id) >> dsl::p<parser<settings_id::min_margin>>)
      | (LEXY_KEYWORD("precision", kw_id) >> dsl::p<parser<settings_id::precision>>);
  static constexpr auto value = lexy::construct<result>;
};

template <settings_id id>
struct setting_name
{
  static constexpr auto rule = dsl::eof;
  static constexpr auto value = lexy::constant(setting_ref<id>{});
};

struct show
{
  static constexpr auto whitespace = dsl::ascii::space;

  struct phasor_name
  {
    static constexpr auto rule = dsl::p<identifier> + dsl::eof;
    static constexpr auto value = lexy::forward<std::string>;
  };

  static constexpr auto rule = dsl::p<settings_parser<setting_name, any_setting>>
                               | dsl::else_ >> dsl::p<phasor_name>;
  static constexpr auto value = lexy::callback<show_command>(
      [](any_setting s) { return show_command{std::move(s)}; },
      [](std::string name) { return show_command{std::move(name)}; });
};

struct unset
{
  static constexpr auto whitespace = dsl::ascii::space;
  static constexpr auto rule = dsl::p<settings_parser<setting_name, any_setting>>;
  static constexpr auto value = lexy::construct<unset_command>;
};

struct reject_policy
{
  static constexpr auto rule = LEXY_KEYWORD("reject", kw_id);
  static constexpr auto value = lexy::constant(duplicate_policy::reject);
};

struct overwrite_policy
{
  static constexpr auto rule = LEXY_KEYWORD("overwrite", kw_id);
  static constexpr auto value = lexy::constant(duplicate_policy::overwrite);
};

template <typename T>
struct value_parser
{
};

template <>
struct value_parser<duplicate_policy>
{
  static constexpr auto rule = dsl::p<reject_policy> | dsl::p<overwrite_policy>;
  static constexpr auto value = lexy::forward<duplicate_policy>;
};

template <>
struct value_parser<std::string>
{
  static constexpr auto rule = dsl::p<identifier>;
  static constexpr auto value = lexy::forward<std::string>;
};

template <>
struct value_parser<double>
{
  static constexpr auto rule = dsl::p<parsed_decimal>;
  static constexpr auto value = lexy::forward<double>;
};

template <>
struct value_parser<int>
{
  static constexpr auto rule = dsl::p<decimal_integer>;
  static constexpr auto value = lexy::forward<int>;
};

template <settings_id id>
struct set_parser
{
  static constexpr auto rule = dsl::p<value_parser<settings_type_t<id>>> + dsl::eof;
  static constexpr auto value = lexy::construct<settings_value<id>>;
};

struct set
{
  static constexpr auto whitespace = dsl::ascii::space;
  static constexpr auto rule = dsl::p<settings_parser<set_parser, any_settings_value>>;
  static constexpr auto value = lexy::construct<set_command>;
};

template <typename command_type>
struct bare
{
  static constexpr auto rule = dsl::eof;
  static constexpr auto value = lexy::constant(command_type{});
};

struct command_ast
{
  static constexpr auto whitespace = dsl::ascii::space;
  static constexpr auto rule = LEXY_KEYWORD("phasor", kw_id) >> dsl::p<phasor_>
                               | LEXY_KEYWORD("chain", kw_id) >> dsl::p<chain_>
                               | LEXY_KEYWORD("show", kw_id) >> dsl::p<show>
                               | LEXY_KEYWORD("list", kw_id) >> dsl::p<bare<list_command>>
                               | LEXY_KEYWORD("bounds", kw_id) >> dsl::p<bare<bounds_command>>
                               | LEXY_KEYWORD("clear", kw_id) >> dsl::p<bare<clear_command>>
                               | LEXY_KEYWORD("set", kw_id) >> dsl::p<set>
                               | LEXY_KEYWORD("unset", kw_id) >> dsl::p<unset>
                               | LEXY_KEYWORD("quit", kw_id) >> dsl::p<bare<quit_command>>;
  static constexpr auto value = lexy::construct<ast::command>;
};

} // namespace r
} // namespace

namespace phasorplot
{
std::optional<ast::command> parse_command_ast(std::string_view line)
{
  auto input = lexy::string_input<lexy::utf8_char_encoding>(line.data(), line.data() + line.size());
  auto result = lexy::parse<r::command_ast>(input, lexy_ext::report_error);
  if (result.is_success())
  {
    return result.value();
  }
  else
  {
    return std::nullopt;
  }
}
} // namespace phasorplot
