/*===========================================================================
*
*                            PUBLIC DOMAIN NOTICE
*               National Center for Biotechnology Information
*
*  This software/database is a "United States Government Work" under the
*  terms of the United States Copyright Act.  It was written as part of
*  the author's official duties as a United States Government employee and
*  thus cannot be copyrighted.  This software/database is freely available
*  to the public for use. The National Library of Medicine and the U.S.
*  Government have not placed any restriction on its use or reproduction.
*
*  Although all reasonable efforts have been taken to ensure the accuracy
*  and reliability of the software and data, the NLM and the U.S.
*  Government do not and cannot warrant the performance or results that
*  may be obtained by using this software or data. The NLM and the U.S.
*  Government disclaim all warranties, express or implied, including
*  warranties of performance, merchantability or fitness for any particular
*  purpose.
*
*  Please cite the author in any work or product based on this material.
*
* ===========================================================================
*
*/

#include <iomanip>
#include <sstream>
#include <boost/algorithm/string.hpp>

#include "output.hpp"
#include "align_exception.hpp"

using namespace std;
namespace PairAlign {

namespace {
string Percent(double value) {
    ostringstream os;
    os << fixed << setprecision(2) << value;
    return os.str();
}
} // namespace

EOutputFormat ParseOutputFormat(const string& name) {
    string n = boost::algorithm::to_lower_copy(name);
    if(n == "pretty")
        return ePretty;
    if(n == "tsv")
        return eTsv;
    throw CAlignException(CAlignException::eInvalidOption, "Unknown output format: "+name+". Available formats: pretty, tsv");
}

void WriteTsvHeader(ostream& os) {
    os << "#seq1\tseq2\tscore\tstart1\tend1\tstart2\tend2\tidentity\tlength\tidentity_percent\tcigar\txcigar\tbtop\n";
}

void WriteAlignment(ostream& os, EOutputFormat format, const string& id1, const string& id2, const string& seq1, const string& seq2,
                    const SAlignmentResult& result, const CScoringMatrix& delta) {
    const CCigar& cigar = result.m_cigar;
    if(format == eTsv) {
        os << id1 << "\t" << id2 << "\t" << result.m_score << "\t"
           << result.m_start_pos1 << "\t" << result.m_end_pos1 << "\t" << result.m_start_pos2 << "\t" << result.m_end_pos2 << "\t"
           << result.m_identity << "\t" << result.m_alignment_length << "\t" << Percent(result.m_identity_percent) << "\t"
           << (cigar.Empty() ? "*" : cigar.CigarString(0, seq1.size())) << "\t"
           << (cigar.Empty() ? "*" : cigar.DetailedCigarString(0, seq1.size(), seq1.c_str(), seq2.c_str())) << "\t"
           << (cigar.Empty() ? "*" : cigar.BtopString(seq1.c_str(), seq2.c_str())) << "\n";
        return;
    }

    os << ">" << id1 << " vs " << id2 << "\n";
    os << "Score: " << result.m_score
       << "  Identity: " << result.m_identity << "/" << result.m_alignment_length << " (" << Percent(result.m_identity_percent) << "%)"
       << "  Seq1: " << result.m_start_pos1 << "-" << result.m_end_pos1
       << "  Seq2: " << result.m_start_pos2 << "-" << result.m_end_pos2 << "\n";
    if(cigar.Empty()) {
        os << "No alignment\n\n";
        return;
    }
    cigar.PrintAlign(seq1.c_str(), seq2.c_str(), delta, os);
    os << "\n";
}

}; // namespace
