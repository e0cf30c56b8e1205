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

#ifndef PAIRALIGN_BATCH_ALIGN__HPP
#define PAIRALIGN_BATCH_ALIGN__HPP

#include <string>
#include <vector>

#include "aligners.hpp"
#include "seq_reader.hpp"

using namespace std;
namespace PairAlign {

struct SBatchResult {
    SAlignmentResult m_result;
    string m_error;    // not empty if this query failed; m_result is then default
};

// Aligns every query to target using ncores threads. Each alignment is computed repeat times.
// A CAlignException fails only its own query; other exceptions are propagated.
vector<SBatchResult> AlignBatch(const CAligner& aligner, const vector<SSequenceRecord>& queries, const SSequenceRecord& target,
                                const SAlignmentOptions& options, int ncores, int repeat = 1);

}; // namespace

#endif  // PAIRALIGN_BATCH_ALIGN__HPP
