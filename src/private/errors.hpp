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

#ifndef ENERTRADE_ERRORS_HPP
#define ENERTRADE_ERRORS_HPP

#include "proto/error.pb.h"

#include <glog/logging.h>

#include <string>

namespace enertrade
{

/**
 * Fills in an error proto with the given code and message.
 */
inline void
SetError (proto::Error& err, const proto::Error::Code code,
          const std::string& msg)
{
  err.Clear ();
  err.set_code (code);
  err.set_message (msg);
  VLOG (1)
      << "Error " << proto::Error::Code_Name (code) << ": " << msg;
}

/**
 * Fills in an INVALID_TRANSITION error for the given states.
 */
inline void
SetTransitionError (proto::Error& err, const std::string& current,
                    const std::string& attempted)
{
  SetError (err, proto::Error::INVALID_TRANSITION,
            "cannot change status from " + current + " to " + attempted);
  err.set_current_state (current);
  err.set_attempted_state (attempted);
}

} // namespace enertrade

#endif // ENERTRADE_ERRORS_HPP
