/*
    Enertrade - peer-to-peer trading of energy blocks
    Copyright (C) 2020  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef ENERTRADE_IDS_HPP
#define ENERTRADE_IDS_HPP

#include <xayautil/cryptorand.hpp>
#include <xayautil/uint256.hpp>

#include <string>

namespace enertrade
{

/**
 * Returns a fresh random identifier (for orders and outbound messages).
 */
inline std::string
GenerateId ()
{
  xaya::CryptoRand rnd;
  return rnd.Get<xaya::uint256> ().ToHex ();
}

} // namespace enertrade

#endif // ENERTRADE_IDS_HPP
