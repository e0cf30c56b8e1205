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

#include <array>
#include <fstream>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cerrno>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>

#include "seq_reader.hpp"
#include "align_exception.hpp"

using namespace std;
namespace PairAlign {

string ErrorMsg(const string& file, int line, const string& msg) {
    return "Error ("+file+":"+to_string(line)+"): "+msg;
}

namespace {

pair<string, size_t> FindNotValidSymbol(const string& seq) {
    string symbol;
    size_t rslt = string::npos;
    for(size_t p = 0; p < seq.size(); ++p) {
        unsigned char c = seq[p];
        if(!isalpha(c) && c != '*' && c != '-' && c != '\n') {
            rslt = p;
            if(isprint(c)) {
                symbol.push_back((char)c);
            } else {
                std::stringstream stream;
                stream << "0x" << std::hex << int(c);
                symbol = stream.str();
            }
            break;
        }
    }
    return make_pair(symbol, rslt);
}

// returns true for fasta, false for fastq
bool OpenStream(const string& file, boost::iostreams::filtering_istream& is) {
    if(file != "-") {
        ifstream gztest(file, ios_base::in|ios_base::binary);
        if(!gztest.is_open())
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "Errno "+to_string(errno)+" opening file "+file));
        array<uint8_t,2> gzstart;
        if(!gztest.read(reinterpret_cast<char*>(gzstart.data()), 2))
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "No data in "+file));
        bool gzipped = (gzstart[0] == 0x1f && gzstart[1] == 0x8b);
        gztest.close();

        ios_base::openmode mode = ios_base::in;
        if(gzipped)
            mode |= ios_base::binary;
        boost::iostreams::file_source f{file, mode};
        if(!f.is_open())
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "Errno "+to_string(errno)+" opening file "+file));
        if(gzipped)
            is.push(boost::iostreams::gzip_decompressor());
        is.push(f);
    } else {
        is.push(cin);
    }
    is.exceptions (std::ios::failbit | std::ios::badbit);

    // do a quick check of validity on first character of the file
    char c;
    try {
        is.get(c);
    } catch (exception &e) {
        if(is.bad() || !is.eof())
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, e.what()+(" in "+file)));
        else
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "No data in "+file));
    }

    if(c != '>' && c != '@')
        throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "File "+file+" must start from > for fasta or from @ for fastq"));

    bool isfasta = (c == '>');
    if(!isfasta) {
        try {
            is.putback(c);
        } catch (exception &e) {
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, e.what()+(" in "+file)));
        }
    }

    return isfasta;
}

bool NextRecord(SSequenceRecord& rec, bool isfasta, boost::iostreams::filtering_istream& is, const string& source_name, size_t& line_num) {
    rec.m_id.clear();
    rec.m_seq.clear();
    if(isfasta) {
        string record;
        ++line_num;
        try {
            getline(is, record, '>');
        } catch (exception &e)  {
            if(is.eof() && !is.bad()) {
                return false; // end of file
            } else {
                string source_line = " in fasta sequence starting at "+source_name+":"+to_string(line_num);
                throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, e.what()+source_line));
            }
        }
        record.erase(remove(record.begin(), record.end(), '\r'), record.end());

        size_t first_ret = record.find('\n');
        if(first_ret == string::npos)
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "fasta record must have ID line "+source_name+":"+to_string(line_num)));

        rec.m_id = record.substr(0, first_ret);
        if(!rec.m_id.empty())
            rec.m_id = rec.m_id.substr(0, rec.m_id.find_first_of(" \t"));
        if(rec.m_id.empty())
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "fasta record must have seq ID "+source_name+":"+to_string(line_num)));

        string& seq = rec.m_seq;
        seq = record.substr(first_ret+1);
        ++line_num;
        if(seq.empty())
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "fasta record must have sequence line "+source_name+":"+to_string(line_num)));

        //check for bad symbols
        auto rslt = FindNotValidSymbol(seq);  // \ns are not yet removed
        if(!rslt.first.empty()) {
            size_t pos = rslt.second;
            size_t lnum = line_num+count(seq.begin(), seq.begin()+pos, '\n');
            string source_line = " in "+source_name+":"+to_string(lnum);
            size_t last_ret = pos > 0 ? seq.find_last_of('\n', pos) : string::npos;
            if(last_ret != string::npos)
                pos -= last_ret+1;
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "Invalid symbol "+rslt.first+source_line+":"+to_string(pos+1)));
        }

        //remove \ns
        auto rend = remove(seq.begin(), seq.end(), '\n');
        if(rend != seq.end())
            line_num += seq.end()-rend-1;
        seq.erase(rend, seq.end());
        if(seq.empty())
            throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "fasta record must have sequence line "+source_name+":"+to_string(line_num)));
    } else { // fastq
        for(int i = 0; i < 4; ++i) {
            ++line_num;
            string source_line = " in fastq "+source_name+":"+to_string(line_num);
            string line;
            try {
                getline(is, line);
            } catch (exception &e) {
                if(is.eof() && !is.bad()) {
                    if(i == 0)
                        return false; // end of file
                    else
                        throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "fastq record must contain 4 lines"+source_line));
                } else {
                    throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, e.what()+source_line));
                }
            }
            if(!line.empty() && line.back() == '\r')
                line.pop_back();
            if(i == 0) {
                if(line.empty() || line[0] != '@')
                    throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "fastq record must start from @"+source_line));
                rec.m_id = line.substr(1, line.find_first_of(" \t")-1);
                if(rec.m_id.empty())
                    throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "fastq record must have seq ID"+source_line));
            }
            if(i == 1) {
                rec.m_seq = line;
                auto rslt = FindNotValidSymbol(rec.m_seq);
                if(!rslt.first.empty())
                    throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "Invalid symbol "+rslt.first+source_line+":"+to_string(rslt.second+1)));
            }
            if(i == 2 && (line.empty() || line[0] != '+'))
                throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "fastq record must have + in the third line"+source_line));
        }
    }

    return true;
}

} // namespace

vector<SSequenceRecord> CSequenceReader::ReadAll() const {
    boost::iostreams::filtering_istream is;
    bool isfasta = OpenStream(m_file, is);

    vector<SSequenceRecord> records;
    size_t line_num = 0;
    SSequenceRecord rec;
    while(NextRecord(rec, isfasta, is, m_file, line_num))
        records.push_back(rec);
    if(records.empty())
        throw CAlignException(CAlignException::eInvalidInput, ErrorMsg(__FILE__, __LINE__, "File "+m_file+" doesn't contain valid sequences"));

    return records;
}

SSequenceRecord CSequenceReader::ReadFirst() const {
    return ReadAll().front();
}

}; // namespace
