//
// EigenConv - VCF to Eigenstrat genotype converter
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file

#include "conversion/ConversionStats.hh"

#include <iostream>



void
ConversionStats::
report(std::ostream& os) const
{
    os << "INFO: Conversion summary:\n"
       << "INFO:\tobserved VCF records: " << observedRecords << "\n"
       << "INFO:\tpanel SNP records: " << panelRecords << "\n"
       << "INFO:\tpanel sites with matching alleles: " << alleleMatches << "\n"
       << "INFO:\tpanel sites with flipped alleles: " << alleleFlips << "\n"
       << "INFO:\tpanel sites with mismatched alleles: " << alleleMismatches << "\n"
       << "INFO:\tpanel-only sites filled from reference: " << panelOnlyRefFilled << "\n"
       << "INFO:\tpanel-only sites set missing: " << panelOnlyMissing << "\n"
       << "INFO:\tobserved records not in panel: " << observedDropped << "\n"
       << "INFO:\ttransitions filtered: " << transitionsFiltered << "\n"
       << "INFO:\tsites written: " << sitesWritten << "\n";
}
