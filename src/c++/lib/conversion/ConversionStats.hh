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

#pragma once

#include <iosfwd>


/// record counts accumulated over one conversion run
///
struct ConversionStats
{
    void
    report(std::ostream& os) const;

    unsigned long observedRecords = 0;
    unsigned long panelRecords = 0;
    unsigned long sitesWritten = 0;

    unsigned long alleleMatches = 0;
    unsigned long alleleFlips = 0;
    /// allele mismatch or non-biallelic observed record at a panel site
    unsigned long alleleMismatches = 0;

    unsigned long panelOnlyRefFilled = 0;
    unsigned long panelOnlyMissing = 0;

    /// observed records with no matching panel site
    unsigned long observedDropped = 0;
    unsigned long transitionsFiltered = 0;
};
