// main.cpp
// Decodes a .torrent file and prints its metainfo as JSON.
#include <cstdio>
#include <iostream>
#include <print>
#include <string_view>
#include <tuple>

#include <BENC/IO/File.hpp>
#include <BENC/Memory/PolyAllocator.hpp>
#include <BENC/Memory/SystemAllocator.hpp>
#include <BENC/Serialization/Bencode/BencodeDecoder.hpp>

using namespace BENC;
using namespace BENC::Serialization;

struct TorrentFile
{
    UInt64                 length {0};
    List<std::string_view> path;
};

struct TorrentInfo
{
    Utilities::Optional<List<TorrentFile>> files;
    Utilities::Optional<UInt64>            length;
    Utilities::Optional<OwnedString>       name;
    UInt64                                 pieceLength {0};
    std::span<const Byte>                  pieces;
};

struct Torrent
{
    std::string_view                                   announce;
    Utilities::Optional<List<List<std::string_view>>> announceList;
    Utilities::Optional<OwnedString>                   comment;
    Utilities::Optional<std::string_view>              createdBy;
    Utilities::Optional<Int64>                         creationDate;
    TorrentInfo                                        info;
};

template<>
struct BENC::Serialization::BencodeRecord<TorrentFile>
{
    static constexpr auto Fields = std::tuple {
            Field("length", &TorrentFile::length),
            Field("path", &TorrentFile::path),
    };
};

template<>
struct BENC::Serialization::BencodeRecord<TorrentInfo>
{
    static constexpr auto Fields = std::tuple {
            Field("files", &TorrentInfo::files),
            Field("length", &TorrentInfo::length),
            Field("name", &TorrentInfo::name),
            Field("piece length", &TorrentInfo::pieceLength),
            Field("pieces", &TorrentInfo::pieces),
    };
};

template<>
struct BENC::Serialization::BencodeRecord<Torrent>
{
    static constexpr auto Fields = std::tuple {
            Field("announce", &Torrent::announce),
            Field("announce-list", &Torrent::announceList),
            Field("comment", &Torrent::comment),
            Field("created by", &Torrent::createdBy),
            Field("creation date", &Torrent::creationDate),
            Field("info", &Torrent::info),
    };
};

namespace
{
    constexpr UIntSize kMaxTorrentBytes = 16 * 1024 * 1024;

    void WriteString(std::ostream& out, std::string_view text)
    {
        static constexpr char kHex[] = "0123456789abcdef";
        out << '"';
        for (const char c: text)
        {
            const auto byte = static_cast<unsigned char>(c);
            switch (c)
            {
                case '"':
                    out << "\\\"";
                    break;
                case '\\':
                    out << "\\\\";
                    break;
                case '\n':
                    out << "\\n";
                    break;
                case '\r':
                    out << "\\r";
                    break;
                case '\t':
                    out << "\\t";
                    break;
                default:
                    if (byte < 0x20 || byte >= 0x7f)
                        out << "\\u00" << kHex[byte >> 4] << kHex[byte & 0xf];
                    else
                        out << c;
                    break;
            }
        }
        out << '"';
    }

    void WriteHex(std::ostream& out, std::span<const Byte> bytes)
    {
        static constexpr char kHex[] = "0123456789abcdef";
        out << '"';
        for (const Byte b: bytes)
        {
            const auto value = static_cast<unsigned>(b);
            out << kHex[value >> 4] << kHex[value & 0xf];
        }
        out << '"';
    }

    void WriteStringList(std::ostream& out, const List<std::string_view>& list)
    {
        out << '[';
        for (UIntSize i = 0; i < list.Size(); ++i)
        {
            if (i > 0)
                out << ',';
            WriteString(out, list[i]);
        }
        out << ']';
    }

    void WriteTorrent(std::ostream& out, const Torrent& torrent)
    {
        out << "{\"announce\":";
        WriteString(out, torrent.announce);
        if (torrent.announceList)
        {
            out << ",\"announce-list\":[";
            for (UIntSize i = 0; i < torrent.announceList->Size(); ++i)
            {
                if (i > 0)
                    out << ',';
                WriteStringList(out, (*torrent.announceList)[i]);
            }
            out << ']';
        }
        if (torrent.comment)
        {
            out << ",\"comment\":";
            WriteString(out, torrent.comment->View());
        }
        if (torrent.createdBy)
        {
            out << ",\"created by\":";
            WriteString(out, *torrent.createdBy);
        }
        if (torrent.creationDate)
            out << ",\"creation date\":" << *torrent.creationDate;

        const TorrentInfo& info = torrent.info;
        out << ",\"info\":{";
        out << "\"files\":";
        if (info.files)
        {
            out << '[';
            for (UIntSize i = 0; i < info.files->Size(); ++i)
            {
                const TorrentFile& file = (*info.files)[i];
                if (i > 0)
                    out << ',';
                out << "{\"length\":" << file.length << ",\"path\":";
                WriteStringList(out, file.path);
                out << '}';
            }
            out << ']';
        }
        else
        {
            out << "null";
        }
        out << ",\"length\":";
        if (info.length)
            out << *info.length;
        else
            out << "null";
        out << ",\"name\":";
        if (info.name)
            WriteString(out, info.name->View());
        else
            out << "null";
        out << ",\"piece length\":" << info.pieceLength;
        out << ",\"pieces\":";
        WriteHex(out, info.pieces);
        out << "}}\n";
    }
}// namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::println(stderr, "usage: {} <file.torrent>", argc > 0 ? argv[0] : "TorrentDump");
        return 1;
    }

    IO::File file;
    if (auto opened = file.Open(argv[1]); !opened)
    {
        const IO::IOError& err = opened.ErrorUnsafe();
        std::println(stderr, "error: {}: {} ({})", IO::ToString(err.code), err.message, err.systemCode);
        return 1;
    }

    auto contents = file.ReadAll(kMaxTorrentBytes);
    if (!contents)
    {
        const IO::IOError& err = contents.ErrorUnsafe();
        std::println(stderr, "error: {}: {} ({})", IO::ToString(err.code), err.message, err.systemCode);
        return 1;
    }
    file.Close();

    Memory::SystemAllocator system;
    BencodeDecodeOptions    options;
    options.allocator = Memory::PolyAllocatorRef {system};

    const std::span<const Byte> bytes {contents.ValueUnsafe().data(), contents.ValueUnsafe().size()};
    auto                        torrent = BencodeDecoder::DecodeOwned<Torrent>(bytes, options);
    if (!torrent)
    {
        const ParseError& err = torrent.ErrorUnsafe();
        if (err.field.empty())
            std::println(stderr, "error: {}: {} at offset {}", ToString(err.code), err.message, err.location.offset);
        else
            std::println(stderr, "error: {}: {} '{}' at offset {}", ToString(err.code), err.message, err.field, err.location.offset);
        return 1;
    }

    WriteTorrent(std::cout, torrent.ValueUnsafe().Get());
    return 0;
}
