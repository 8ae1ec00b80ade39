#pragma once

#include <expected>
#include <system_error>

namespace tessera::ledger {

enum class ledger_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unauthorized,
  invalid_argument,
  insufficient_balance,
  insufficient_allowance,
  allowance_race_condition
};

const std::error_category& ledger_category() noexcept;

std::error_code make_error_code( ledger_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::ledger

template<>
struct std::is_error_code_enum< tessera::ledger::ledger_errc >: public std::true_type
{};
