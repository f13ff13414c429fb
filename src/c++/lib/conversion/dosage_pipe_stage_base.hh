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

#include "conversion/DosageRecord.hh"

#include <memory>


/// Base class for the processing chain from normalized dosage records to
/// encoded output
///
/// Record ownership is passed down the pipe via unique_ptr/move
///
class dosage_pipe_stage_base
{
public:
    /// Insert new dosage record into this pipeline stage
    virtual void process(std::unique_ptr<DosageRecord> record)
    {
        if (_sink) _sink->process(std::move(record));
    }

    void flush()
    {
        flush_impl();
        if (_sink)
            _sink->flush();
    }

    explicit dosage_pipe_stage_base(const std::shared_ptr<dosage_pipe_stage_base>& sink) : _sink(sink) {}

    virtual ~dosage_pipe_stage_base() {}

protected:
    dosage_pipe_stage_base() : _sink(nullptr) {}

    virtual void flush_impl() {}

    std::shared_ptr<dosage_pipe_stage_base> _sink;
};
