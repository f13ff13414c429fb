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

#include "conversion/ConversionStats.hh"
#include "conversion/dosage_pipe_stage_base.hh"


/// drops transition sites (A<->G, C<->T), all other records pass unchanged
///
class TransversionFilterStage : public dosage_pipe_stage_base
{
public:
    TransversionFilterStage(
        ConversionStats& stats,
        std::shared_ptr<dosage_pipe_stage_base> nextStage);

    void process(std::unique_ptr<DosageRecord> record) override;

private:
    ConversionStats& _stats;
};
