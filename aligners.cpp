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

#include <boost/algorithm/string.hpp>

#include "aligners.hpp"
#include "align_exception.hpp"

using namespace std;
namespace PairAlign {

void CAligner::ValidateAndPrepare(const string& seq1, const string& seq2, const SAlignmentOptions& options, string& a, string& b) {
    options.ValidateGaps();
    a = PrepareSequence(seq1, options.m_case_normalize);
    b = PrepareSequence(seq2, options.m_case_normalize);
    if(a.empty())
        throw CAlignException(CAlignException::eEmptySequence, "seq1 is empty or contains only whitespace");
    if(b.empty())
        throw CAlignException(CAlignException::eEmptySequence, "seq2 is empty or contains only whitespace");
}

void CAligner::PrepareAndValidate(const string& seq1, const string& seq2, const SAlignmentOptions& options, string& a, string& b) {
    a = PrepareSequence(seq1, options.m_case_normalize);
    b = PrepareSequence(seq2, options.m_case_normalize);
    if(a.empty() || b.empty())
        throw CAlignException(CAlignException::eEmptySequence, "sequences cannot be empty");
    options.ValidateGaps();
}

const vector<string>& AlignerNames() {
    static const vector<string> names = {"global", "local", "semiglobal", "overlap", "banded", "hirschberg"};
    return names;
}

unique_ptr<CAligner> CreateAligner(const string& name) {
    string n = boost::algorithm::to_lower_copy(name);
    if(n == "global" || n == "nw")
        return unique_ptr<CAligner>(new CGlobalAligner);
    if(n == "local" || n == "sw")
        return unique_ptr<CAligner>(new CLocalAligner);
    if(n == "semiglobal" || n == "semi-global")
        return unique_ptr<CAligner>(new CSemiGlobalAligner);
    if(n == "overlap")
        return unique_ptr<CAligner>(new COverlapAligner);
    if(n == "banded")
        return unique_ptr<CAligner>(new CBandedAligner);
    if(n == "hirschberg" || n == "space-efficient")
        return unique_ptr<CAligner>(new CSpaceEfficientAligner);

    throw CAlignException(CAlignException::eInvalidOption, "Unknown algorithm: "+name+". Available algorithms: "+boost::algorithm::join(AlignerNames(), ", "));
}

}; // namespace
