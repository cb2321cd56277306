#pragma once

#include <string>

//---------------------------------------------------------------------------
namespace bt {
//---------------------------------------------------------------------------
/**
 * Converts the given Bluetooth address into the form BlueZ reports addresses in: "AA:BB:CC:DD:EE:FF".
 * Accepts six groups of two hex digits separated by ':' or '-', three groups of four hex digits separated by '.'
 * or twelve hex digits without any separator. The case of the input does not matter.
 * Returns false in case the address is malformed. result is only written on success.
 **/
bool normalize_address(const std::string& addr, std::string* result);
/**
 * Returns true in case the given address already is in the "AA:BB:CC:DD:EE:FF" form.
 **/
[[nodiscard]] bool is_normalized_address(const std::string& addr);
//---------------------------------------------------------------------------
}  // namespace bt
//---------------------------------------------------------------------------
