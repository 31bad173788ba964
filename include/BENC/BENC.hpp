#pragma once
#include <BENC/Defines.hpp>
#include <BENC/IO/File.hpp>
#include <BENC/IO/IOError.hpp>
#include <BENC/Memory/AllocatorConcept.hpp>
#include <BENC/Memory/PolyAllocator.hpp>
#include <BENC/Memory/SystemAllocator.hpp>
#include <BENC/Memory/TrackingAllocator.hpp>
#include <BENC/Primitives.hpp>
#include <BENC/Serialization/Bencode/BencodeDecoder.hpp>
#include <BENC/Serialization/Bencode/BencodeSchema.hpp>
#include <BENC/Serialization/Bencode/BencodeToken.hpp>
#include <BENC/Serialization/Bencode/BencodeTokenizer.hpp>
#include <BENC/Serialization/Bencode/BencodeTypes.hpp>
#include <BENC/Serialization/Core/InputCursor.hpp>
#include <BENC/Serialization/Core/ParseError.hpp>
#include <BENC/Utilities/Expected.hpp>
#include <BENC/Utilities/Optional.hpp>
