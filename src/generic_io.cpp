/*
    author: Suhas Vittal
    date:   23 September 2025
*/

#include "generic_io.h"

#include <limits>
#include <stdexcept>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

LZMA_FILE::LZMA_FILE(FILE* _file_istrm)
    :file_istrm(_file_istrm)
{
    lzma_strm = LZMA_STREAM_INIT;
    lzma_ret r = lzma_stream_decoder(&lzma_strm, std::numeric_limits<uint64_t>::max(), LZMA_CONCATENATED);
    if (r != LZMA_OK)
    {
        fclose(file_istrm);
        is_open = false;
        throw std::runtime_error("LZMA_FILE: lzma_stream_decoder failed: error code " + std::to_string(r));
    }
    read_chunk_from_file();
}

LZMA_FILE::~LZMA_FILE()
{
    if (is_open)
        close();
}

size_t
LZMA_FILE::read(void* buf, size_t size)
{
    lzma_strm.next_out = static_cast<uint8_t*>(buf);
    lzma_strm.avail_out = size;

    while (lzma_strm.avail_out > 0 && !eof())
    {
        if (lzma_strm.avail_in == 0 && !feof(file_istrm))
            read_chunk_from_file();
        lzma_ret r = lzma_code(&lzma_strm, feof(file_istrm) ? LZMA_FINISH : LZMA_RUN);
        if (r == LZMA_STREAM_END)
        {
            stream_end = true;
            break;
        }
        if (r != LZMA_OK)
            throw std::runtime_error("LZMA_FILE::read: lzma_code failed: error code " + std::to_string(r));
    }

    return size - lzma_strm.avail_out;
}

bool
LZMA_FILE::eof() const
{
    return stream_end || (lzma_strm.avail_in == 0 && feof(file_istrm));
}

void
LZMA_FILE::close()
{
    fclose(file_istrm);
    lzma_end(&lzma_strm);
    is_open = false;
}

void
LZMA_FILE::read_chunk_from_file()
{
    size_t bytes_read = fread(lzma_buf, 1, LZMA_BUF_SIZE, file_istrm);
    lzma_strm.next_in = reinterpret_cast<uint8_t*>(lzma_buf);
    lzma_strm.avail_in = bytes_read;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

GENERIC_STRM_TYPE_ID
generic_strm_type_id(const generic_strm_type& strm)
{
    return static_cast<GENERIC_STRM_TYPE_ID>(strm.index());
}

void
generic_strm_open(generic_strm_type& strm, std::string file_path, std::string mode)
{
    auto ends_with = [&file_path] (const std::string& ext)
    {
        return file_path.size() >= ext.size() && file_path.compare(file_path.size()-ext.size(), ext.size(), ext) == 0;
    };

    if (ends_with(".gz"))
    {
        gzFile f = gzopen(file_path.c_str(), mode.c_str());
        if (f == nullptr)
            throw std::runtime_error("generic_strm_open: cannot open -- " + file_path);
        strm = f;
    }
    else if (ends_with(".xz"))
    {
        if (mode.find('r') == std::string::npos)
            throw std::runtime_error("generic_strm_open: xz files are read only -- " + file_path);
        FILE* file_istrm = fopen(file_path.c_str(), mode.c_str());
        if (file_istrm == nullptr)
            throw std::runtime_error("generic_strm_open: cannot open -- " + file_path);
        strm = new LZMA_FILE(file_istrm);
    }
    else
    {
        FILE* f = fopen(file_path.c_str(), mode.c_str());
        if (f == nullptr)
            throw std::runtime_error("generic_strm_open: cannot open -- " + file_path);
        strm = f;
    }
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

size_t
generic_strm_read(generic_strm_type& strm, void* buf, size_t size)
{
    switch (generic_strm_type_id(strm))
    {
    case GENERIC_STRM_TYPE_ID::FILE:
        return fread(buf, 1, size, std::get<FILE*>(strm));
    case GENERIC_STRM_TYPE_ID::GZ:
        {
            int n = gzread(std::get<gzFile>(strm), buf, static_cast<unsigned>(size));
            if (n < 0)
                throw std::runtime_error("generic_strm_read: gzread failed");
            return static_cast<size_t>(n);
        }
    case GENERIC_STRM_TYPE_ID::XZ:
        return std::get<LZMA_FILE*>(strm)->read(buf, size);
    }
    throw std::runtime_error("generic_strm_read: invalid stream type: " + std::to_string(strm.index()));
}

void
generic_strm_write(generic_strm_type& strm, const void* buf, size_t size)
{
    switch (generic_strm_type_id(strm))
    {
    case GENERIC_STRM_TYPE_ID::FILE:
        if (fwrite(buf, 1, size, std::get<FILE*>(strm)) != size)
            throw std::runtime_error("generic_strm_write: short write");
        break;
    case GENERIC_STRM_TYPE_ID::GZ:
        if (size > 0 && gzwrite(std::get<gzFile>(strm), buf, static_cast<unsigned>(size)) == 0)
            throw std::runtime_error("generic_strm_write: gzwrite failed");
        break;
    case GENERIC_STRM_TYPE_ID::XZ:
        throw std::runtime_error("generic_strm_write: writing to LZMA file is not supported");
    }
}

void
generic_strm_write(generic_strm_type& strm, const std::string& s)
{
    generic_strm_write(strm, s.data(), s.size());
}

bool
generic_strm_getline(generic_strm_type& strm, std::string& line)
{
    line.clear();
    bool read_any{false};
    char c;
    while (generic_strm_read(strm, &c, 1) == 1)
    {
        read_any = true;
        if (c == '\n')
            return true;
        line.push_back(c);
    }
    return read_any;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
generic_strm_close(generic_strm_type& strm)
{
    switch (generic_strm_type_id(strm))
    {
    case GENERIC_STRM_TYPE_ID::FILE:
        fclose(std::get<FILE*>(strm));
        break;
    case GENERIC_STRM_TYPE_ID::GZ:
        gzclose(std::get<gzFile>(strm));
        break;
    case GENERIC_STRM_TYPE_ID::XZ:
        {
            LZMA_FILE* f = std::get<LZMA_FILE*>(strm);
            f->close();
            delete f;
        }
        break;
    }
}

bool
generic_strm_eof(const generic_strm_type& strm)
{
    switch (generic_strm_type_id(strm))
    {
    case GENERIC_STRM_TYPE_ID::FILE:
        return feof(std::get<FILE*>(strm));
    case GENERIC_STRM_TYPE_ID::GZ:
        return gzeof(std::get<gzFile>(strm));
    case GENERIC_STRM_TYPE_ID::XZ:
        return std::get<LZMA_FILE*>(strm)->eof();
    }
    throw std::runtime_error("generic_strm_eof: invalid stream type: " + std::to_string(strm.index()));
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////
