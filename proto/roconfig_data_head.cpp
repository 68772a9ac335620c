/*
    GSP for the Bond Sale Engine
    Copyright (C) 2019-2020  Autonomous Worlds Ltd

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

/* Head of the generated source file that embeds the text protos of the
   read-only configuration.  The build system concatenates this file,
   roconfig.pb.text, roconfig_data_mid.cpp, roconfig_regtest.pb.text
   and roconfig_data_tail.cpp.  */

namespace bonds
{

extern const char ROCONFIG_PROTO_TEXT[];
extern const char ROCONFIG_PROTO_TEXT_REGTEST[];

const char ROCONFIG_PROTO_TEXT[] = R"pbtext(
