#include "filefuse/errors.h"

namespace filefuse {

std::string_view errorCode(SplitError error) {
    switch (error) {
        case SplitError::InFileNotFound:
            return "in_file_not_found";
        case SplitError::InFileNotFile:
            return "in_file_not_file";
        case SplitError::InFileNotSet:
            return "in_file_not_set";
        case SplitError::InFileNotOpened:
            return "in_file_not_opened";
        case SplitError::InFileNotRead:
            return "in_file_not_read";
        case SplitError::OutDirNotCreated:
            return "out_dir_not_created";
        case SplitError::OutDirNotDir:
            return "out_dir_not_dir";
        case SplitError::OutDirNotSet:
            return "out_dir_not_set";
        case SplitError::OutFileNotOpened:
            return "out_file_not_opened";
        case SplitError::OutFileNotWritten:
            return "out_file_not_written";
        case SplitError::ChunkSizeInvalid:
            return "chunk_size_invalid";
        case SplitError::BufferCapacityInvalid:
            return "buffer_capacity_invalid";
    }
    return "unknown";
}

std::string_view errorCode(CheckError error) {
    switch (error) {
        case CheckError::InDirNotFound:
            return "in_dir_not_found";
        case CheckError::InDirNotDir:
            return "in_dir_not_dir";
        case CheckError::InDirNotSet:
            return "in_dir_not_set";
        case CheckError::InFileNotOpened:
            return "in_file_not_opened";
        case CheckError::InFileNotRead:
            return "in_file_not_read";
        case CheckError::FileSizeNotSet:
            return "file_size_not_set";
        case CheckError::TotalChunksNotSet:
            return "total_chunks_not_set";
        case CheckError::MissingChunks:
            return "missing_chunks";
        case CheckError::SizeMismatch:
            return "size_mismatch";
    }
    return "unknown";
}

std::string_view errorCode(MergeError error) {
    switch (error) {
        case MergeError::InDirNotFound:
            return "in_dir_not_found";
        case MergeError::InDirNotDir:
            return "in_dir_not_dir";
        case MergeError::InDirNotSet:
            return "in_dir_not_set";
        case MergeError::InDirNotRead:
            return "in_dir_not_read";
        case MergeError::InDirNoFile:
            return "in_dir_no_file";
        case MergeError::InFileNotOpened:
            return "in_file_not_opened";
        case MergeError::InFileNotRead:
            return "in_file_not_read";
        case MergeError::InFileNameInvalid:
            return "in_file_name_invalid";
        case MergeError::OutDirNotCreated:
            return "out_dir_not_created";
        case MergeError::OutFileNotSet:
            return "out_file_not_set";
        case MergeError::OutFileNotRemoved:
            return "out_file_not_removed";
        case MergeError::OutFileNotOpened:
            return "out_file_not_opened";
        case MergeError::OutFileNotWritten:
            return "out_file_not_written";
        case MergeError::BufferCapacityInvalid:
            return "buffer_capacity_invalid";
    }
    return "unknown";
}

std::string_view errorMessage(SplitError error) {
    switch (error) {
        case SplitError::InFileNotFound:
            return "The input file was not found.";
        case SplitError::InFileNotFile:
            return "The input path is not a regular file.";
        case SplitError::InFileNotSet:
            return "The input file is not set.";
        case SplitError::InFileNotOpened:
            return "The input file could not be opened.";
        case SplitError::InFileNotRead:
            return "The input file could not be read.";
        case SplitError::OutDirNotCreated:
            return "The output directory could not be created.";
        case SplitError::OutDirNotDir:
            return "The output path is not a directory.";
        case SplitError::OutDirNotSet:
            return "The output directory is not set.";
        case SplitError::OutFileNotOpened:
            return "A chunk file could not be created or opened.";
        case SplitError::OutFileNotWritten:
            return "A chunk file could not be written.";
        case SplitError::ChunkSizeInvalid:
            return "The chunk size must be at least one byte.";
        case SplitError::BufferCapacityInvalid:
            return "The buffer capacity must be at least one byte.";
    }
    return "Unknown split error.";
}

std::string_view errorMessage(CheckError error) {
    switch (error) {
        case CheckError::InDirNotFound:
            return "The input directory was not found.";
        case CheckError::InDirNotDir:
            return "The input path is not a directory.";
        case CheckError::InDirNotSet:
            return "The input directory is not set.";
        case CheckError::InFileNotOpened:
            return "A chunk file could not be opened.";
        case CheckError::InFileNotRead:
            return "A chunk file could not be read.";
        case CheckError::FileSizeNotSet:
            return "The expected file size is not set.";
        case CheckError::TotalChunksNotSet:
            return "The expected total chunk count is not set.";
        case CheckError::MissingChunks:
            return "Some of the chunks needed to merge the file are missing.";
        case CheckError::SizeMismatch:
            return "The combined chunk size does not match the expected file size.";
    }
    return "Unknown check error.";
}

std::string_view errorMessage(MergeError error) {
    switch (error) {
        case MergeError::InDirNotFound:
            return "The input directory was not found.";
        case MergeError::InDirNotDir:
            return "The input path is not a directory.";
        case MergeError::InDirNotSet:
            return "The input directory is not set.";
        case MergeError::InDirNotRead:
            return "The input directory could not be read.";
        case MergeError::InDirNoFile:
            return "The input directory has no chunk files.";
        case MergeError::InFileNotOpened:
            return "A chunk file could not be opened.";
        case MergeError::InFileNotRead:
            return "A chunk file could not be read.";
        case MergeError::InFileNameInvalid:
            return "A chunk file name is not a non-negative decimal index.";
        case MergeError::OutDirNotCreated:
            return "The output directory could not be created.";
        case MergeError::OutFileNotSet:
            return "The output file is not set.";
        case MergeError::OutFileNotRemoved:
            return "The existing output path could not be removed.";
        case MergeError::OutFileNotOpened:
            return "The output file could not be opened.";
        case MergeError::OutFileNotWritten:
            return "The output file could not be written.";
        case MergeError::BufferCapacityInvalid:
            return "The buffer capacity must be at least one byte.";
    }
    return "Unknown merge error.";
}

bool isFinding(CheckError error) {
    return error == CheckError::MissingChunks || error == CheckError::SizeMismatch;
}

}  // namespace filefuse
