//
// Created by igor on 02/09/2025.
//

#include <polyglot/exceptions.hh>

namespace polyglot {

    std::string_view to_string(error_code code) {
        switch (code) {
            case error_code::malformed_signature:            return "MalformedSignature";
            case error_code::truncated_chunk:                return "TruncatedChunk";
            case error_code::missing_header_chunk:           return "MissingHeaderChunk";
            case error_code::missing_trailer_chunk:          return "MissingTrailerChunk";
            case error_code::invalid_chunk_type:             return "InvalidChunkType";
            case error_code::eocd_not_found:                 return "EocdNotFound";
            case error_code::central_directory_corrupt:      return "CentralDirectoryCorrupt";
            case error_code::zip64_unsupported:              return "Zip64Unsupported";
            case error_code::not_riff:                       return "NotRiff";
            case error_code::not_wave:                       return "NotWave";
            case error_code::missing_fmt_chunk:              return "MissingFmtChunk";
            case error_code::missing_data_chunk:             return "MissingDataChunk";
            case error_code::chunk_crc_mismatch:             return "ChunkCrcMismatch";
            case error_code::entry_crc_mismatch:             return "EntryCrcMismatch";
            case error_code::size_mismatch:                  return "SizeMismatch";
            case error_code::unreconciled_offsets:           return "UnreconciledOffsets";
            case error_code::payload_too_large:              return "PayloadTooLarge";
            case error_code::offset_overflow:                return "OffsetOverflow";
            case error_code::unsupported_strategy:           return "UnsupportedStrategy";
            case error_code::bidirectional_infeasible:       return "BidirectionalInfeasible";
            case error_code::critical_chunk_rejected:        return "CriticalChunkRejected";
            case error_code::no_embedded_payload_found:      return "NoEmbeddedPayloadFound";
            case error_code::composition_invariant_violated: return "CompositionInvariantViolated";
        }
        // make compiler happy
        return "Unknown";
    }

} // namespace polyglot
