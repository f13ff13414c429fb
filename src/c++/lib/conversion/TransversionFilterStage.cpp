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

#include "conversion/TransversionFilterStage.hh"

#include "blt_util/seq_util.hh"



TransversionFilterStage::
TransversionFilterStage(
    ConversionStats& stats,
    std::shared_ptr<dosage_pipe_stage_base> nextStage)
    : dosage_pipe_stage_base(nextStage)
    , _stats(stats)
{}



void
TransversionFilterStage::
process(std::unique_ptr<DosageRecord> record)
{
    if (is_transition(record->ref, record->alt))
    {
        _stats.transitionsFiltered++;
        return;
    }
    if (_sink) _sink->process(std::move(record));
}
