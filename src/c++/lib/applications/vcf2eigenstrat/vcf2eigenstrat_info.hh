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

#include "blt_util/prog_info_base.hh"


struct vcf2eigenstrat_info : public prog_info_base
{
    static
    const prog_info& get()
    {
        static const vcf2eigenstrat_info vci;
        return vci;
    }

private:
    const char* name() const override
    {
        static const char NAME[] = "vcf2eigenstrat";
        return NAME;
    }

    void usage(const char* xmessage = nullptr) const override;

    vcf2eigenstrat_info() {}
    ~vcf2eigenstrat_info() override {}
};
