#ifndef LEDGER_DETAIL_FIXED_HEX_HPP
#define LEDGER_DETAIL_FIXED_HEX_HPP

#include<cstddef>
#include<cstdint>
#include<string>

namespace Ledger { namespace Detail {

/* Hex text of exactly `size` bytes, with or without
 * a "0x" prefix, in either case.  */
bool fixed_hex_valid(std::string const& s, std::size_t size);
/* Pre-condition: fixed_hex_valid(s, size).  */
void fixed_hex_read(std::string const& s, std::uint8_t* out, std::size_t size);

}}

#endif /* !defined(LEDGER_DETAIL_FIXED_HEX_HPP) */
