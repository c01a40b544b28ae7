#include "pagedio/random_access_read.hpp"
#include "pagedio/errors.hpp"

int RandomAccessRead::peek() {
    int result = read();
    if (result != END_OF_FILE) {
        rewind(1);
    }
    return result;
}

void RandomAccessRead::rewind(int64_t bytes) {
    int64_t position = get_position();
    if (bytes > position) {
        throw RangeError("Cannot rewind " + std::to_string(bytes) + " bytes before start", position - bytes);
    }
    seek(position - bytes);
}

bool RandomAccessRead::is_eof() {
    return peek() == END_OF_FILE;
}

void RandomAccessRead::read_fully(uint8_t* buffer, size_t off, size_t len) {
    size_t done = 0;
    while (done < len) {
        int n = read(buffer, off + done, len - done);
        if (n == END_OF_FILE) {
            throw EndOfFileError("Premature end of data: wanted " + std::to_string(len) + " bytes, got " +
                                 std::to_string(done));
        }
        done += static_cast<size_t>(n);
    }
}

std::vector<uint8_t> RandomAccessRead::read_fully(size_t len) {
    std::vector<uint8_t> out(len);
    read_fully(out.data(), 0, len);
    return out;
}
