/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#include "termlog/logbuf/term_meta_data.hpp"

#include <ostream>

namespace termlog {
namespace logbuf {

void TermMetaData::reset() {
  set_tail_counter(0);
  set_high_water_mark(0);
  set_status(kTermClean);
}

std::ostream& operator<<(std::ostream& o, const TermMetaData& v) {
  o << "<TermMetaData>";
  if (v.is_valid()) {
    o << "<status_>" << (v.get_status() == kTermClean ? "kTermClean" : "kTermNeedsCleaning")
      << "</status_>"
      << "<tail_counter_>" << v.get_tail_counter() << "</tail_counter_>"
      << "<high_water_mark_>" << v.get_high_water_mark() << "</high_water_mark_>";
  }
  o << "</TermMetaData>";
  return o;
}

}  // namespace logbuf
}  // namespace termlog
