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

#include "Vcf2EigenstratRun.hh"

#include "blt_util/log.hh"
#include "blt_util/OrderedMergeStreamer.hh"
#include "blt_util/reference_contig_segment.hh"
#include "conversion/ConversionStats.hh"
#include "conversion/EigenstratEncoder.hh"
#include "conversion/PassThroughConverter.hh"
#include "conversion/SnpPanelReconciler.hh"
#include "conversion/TransversionFilterStage.hh"
#include "eigenstrat/EigenstratSnpStreamer.hh"
#include "eigenstrat/EigenstratWriter.hh"
#include "htsapi/samtools_fasta_util.hh"
#include "htsapi/vcf_streamer.hh"

#include <iostream>
#include <memory>



/// merge the SNP panel with the VCF records and reconcile each panel site
static
void
convertWithSnpPanel(
    const Vcf2EigenstratOptions& opt,
    vcf_streamer& vcfStream,
    dosage_pipe_stage_base& pipeHead,
    ConversionStats& stats)
{
    EigenstratSnpStreamer snpStream(opt.snpFilename.c_str(), opt.chrom);

    std::unique_ptr<reference_contig_segment> refSegmentPtr;
    if (! opt.referenceFilename.empty())
    {
        refSegmentPtr.reset(new reference_contig_segment);
        getChromReferenceSegment(opt.referenceFilename, opt.chrom, *refSegmentPtr);
        log_os << "INFO: Loaded " << refSegmentPtr->seq().size() << " reference bases for chromosome '"
               << opt.chrom << "'\n";
    }

    SnpPanelReconciler reconciler(vcfStream.getSampleCount(), refSegmentPtr.get(), stats);

    OrderedMergeStreamer<EigenstratSnpStreamer, vcf_streamer, SnpVcfPositionCompare>
    mergeStream(snpStream, vcfStream);

    try
    {
        while (mergeStream.next())
        {
            const SnpPanelReconciler::pair_t pair(mergeStream.getCurrentPair());
            if (pair.hasLeft()) stats.panelRecords++;
            if (pair.hasRight()) stats.observedRecords++;

            std::unique_ptr<DosageRecord> record(reconciler.reconcile(pair));
            if (record) pipeHead.process(std::move(record));
        }
    }
    catch (...)
    {
        log_os << "\nException caught while merging SNP panel and VCF records. Input stream state:\n";
        snpStream.report_state(log_os);
        vcfStream.report_state(log_os);
        throw;
    }
}



static
void
convertPassThrough(
    const Vcf2EigenstratOptions& opt,
    vcf_streamer& vcfStream,
    dosage_pipe_stage_base& pipeHead,
    ConversionStats& stats)
{
    PassThroughConverter converter(opt.chrom, vcfStream.getSampleCount());

    try
    {
        while (vcfStream.next())
        {
            stats.observedRecords++;
            pipeHead.process(converter.convert(*(vcfStream.get_record_ptr())));
        }
    }
    catch (...)
    {
        log_os << "\nException caught while converting VCF records. Input stream state:\n";
        vcfStream.report_state(log_os);
        throw;
    }
}



void
runVcf2Eigenstrat(
    const Vcf2EigenstratOptions& opt)
{
    static const bool isBiallelicSnpOnly(true);
    vcf_streamer vcfStream(opt.vcfFilename.c_str(), isBiallelicSnpOnly);

    log_os << "INFO: Found " << vcfStream.getSampleCount() << " samples in VCF file: '"
           << vcfStream.name() << "'\n";

    EigenstratWriter writer(opt.outPrefix, vcfStream.getSampleNames());

    ConversionStats stats;

    // assemble the pipeline back to front:
    std::shared_ptr<dosage_pipe_stage_base> pipeHead(
        new EigenstratEncoder(opt.getOutChrom(), writer, stats));
    if (opt.isTransversionsOnly)
    {
        std::shared_ptr<dosage_pipe_stage_base> filter(new TransversionFilterStage(stats, pipeHead));
        pipeHead = filter;
    }

    if (opt.isSnpPanel())
    {
        convertWithSnpPanel(opt, vcfStream, *pipeHead, stats);
    }
    else
    {
        convertPassThrough(opt, vcfStream, *pipeHead, stats);
    }

    pipeHead->flush();
    writer.flush();

    stats.report(log_os);
}
