// WeaveWriter is the class rendered documents go out through. It knows just enough Markdown to put chunk output in fenced blocks.
#pragma once
#include <string>
#include <mapview.hpp>


struct WriteOutput {
    virtual ~WriteOutput() {}

    virtual void write(const char* data, size_t length) = 0;
};


struct FileWriteOutput : WriteOutput {
    const static int BufferSize = 4096; // 4kb buffer
    int file;
    char buffer[BufferSize]; // buffer to prevent small writes
    size_t bufferPos = 0;

    FileWriteOutput(FileWriteOutput&& f); // takes over the descriptor and anything still buffered

    FileWriteOutput(int fd);

    ~FileWriteOutput(); // Destructing a FileWriteOutput will flush the buffer and close the file.

    bool isValid();

    void write(const char* data, size_t length); // load some data into the buffer, and flush the buffer if the data overfills

    void flush();
};


struct StringWriteOutput : WriteOutput {
    std::string content;

    void write(const char* data, size_t length);
};


struct WeaveWriter {
    WriteOutput& output;
    char lbyte = '\n'; // last byte written; we start at the beginning of a line

    WeaveWriter(WriteOutput& out);

    void write(const char* data, size_t length);

    void write(std::string data);

    void write(MapView data);

    void newline(); // only if we aren't already at the start of a line

    void fence(std::string info, std::string body); // ```info\nbody\n```
};
