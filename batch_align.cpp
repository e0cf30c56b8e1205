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

#include <list>
#include <functional>

#include "batch_align.hpp"
#include "align_exception.hpp"
#include "common_util.hpp"

using namespace std;
namespace PairAlign {

vector<SBatchResult> AlignBatch(const CAligner& aligner, const vector<SSequenceRecord>& queries, const SSequenceRecord& target,
                                const SAlignmentOptions& options, int ncores, int repeat) {
    vector<SBatchResult> results(queries.size());
    list<function<void()>> jobs;
    for(size_t q = 0; q < queries.size(); ++q) {
        jobs.push_back([&, q]() {
            try {
                for(int r = 0; r < repeat; ++r)
                    results[q].m_result = aligner.Align(queries[q].m_seq, target.m_seq, options);
            } catch(CAlignException& e) {
                results[q].m_result = SAlignmentResult();
                results[q].m_error = string(e.GetErrCodeString())+": "+e.what();
            }
        });
    }
    RunThreads(ncores, jobs);

    return results;
}

}; // namespace
