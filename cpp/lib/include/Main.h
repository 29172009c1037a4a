/** \file   Main.h
 *  \brief  Default main entry point.
 *  \author Madeeswaran Kannan (madeeswaran.kannan@uni-tuebingen.de)
 *
 *  \copyright 2020-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


// Programs linking against libolsync implement Main() instead of main().  The default main() strips an optional
// leading --min-log-level=(ERROR|WARNING|INFO|DEBUG) argument, calls Main() and reports any escaping std::exception
// via LOG_ERROR.
int Main(int argc, char *argv[]);


int main(int argc, char *argv[]) __attribute__((weak));
