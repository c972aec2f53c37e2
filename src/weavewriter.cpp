// WeaveWriter is the class rendered documents go out through.
#include <weavewriter.hpp>
#include <unistd.h>
#include <cstring>
#include <cstdio>
#include <util.hpp>


FileWriteOutput::FileWriteOutput(int fd) {
    file = fd;
}

FileWriteOutput::FileWriteOutput(FileWriteOutput&& f) {
    file = f.file;
    bufferPos = f.bufferPos;
    memcpy(buffer, f.buffer, bufferPos);
    f.file = -1; // the old one must not close or flush anything
    f.bufferPos = 0;
}

bool FileWriteOutput::isValid() {
    return file != -1;
}

void FileWriteOutput::write(const char* data, size_t length) {
    while (length > 0) {
        size_t writeSize = BufferSize - bufferPos; // the space remaining
        if (writeSize > length) {
            writeSize = length;
        }
        if (writeSize == 0) {
            flush();
        }
        else {
            memcpy(buffer + bufferPos, data, writeSize);
            bufferPos += writeSize;
            data += writeSize;
            length -= writeSize;
        }
    }
}

void FileWriteOutput::flush() {
    if (file == -1) {
        bufferPos = 0;
        return;
    }
    size_t written = 0;
    while (written < bufferPos) {
        ssize_t r = ::write(file, buffer + written, bufferPos - written);
        if (r <= 0) {
            printf(ERROR "Write failed; %zu bytes were lost.\n", bufferPos - written);
            perror("\twrite");
            break;
        }
        written += r;
    }
    bufferPos = 0;
}

FileWriteOutput::~FileWriteOutput() {
    if (file != -1) {
        flush();
        ::close(file);
    }
}

void StringWriteOutput::write(const char* data, size_t length) {
    content += std::string(data, length);
}


WeaveWriter::WeaveWriter(WriteOutput& out) : output(out){}

void WeaveWriter::write(const char* data, size_t length) {
    if (length == 0) {
        return;
    }
    output.write(data, length);
    lbyte = data[length - 1];
}

void WeaveWriter::write(std::string data) {
    write(data.c_str(), data.size());
}

void WeaveWriter::write(MapView data) {
    write(data.cbuf(), data.len());
}

void WeaveWriter::newline() {
    if (lbyte != '\n') {
        write("\n", 1);
    }
}

void WeaveWriter::fence(std::string info, std::string body) {
    newline();
    write("```" + info + "\n");
    write(body);
    newline();
    write("```\n");
}
