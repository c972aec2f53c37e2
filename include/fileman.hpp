/* Fileman is a class that pulls WeaveWriter and MapView all together. It manages the output directory (rendered documents and figures)
    and reads from the input directory.
*/
#pragma once
#include <string>
#include <defs.h>
#include <map>
#include <mapview.hpp>
#include <weavewriter.hpp>
#include <util.hpp>


FileWriteOutput createFile(std::string path); // create a file and all of its parent directories. check isValid()!


struct FileMan {
    std::map<std::string, MapView> maps;

    std::string transmuted(std::string path); // path inside this directory

    std::string arcTransmuted(std::string path); // strip off this directory from a path (returning something relative to this directory), if possible

    bool valid = true; // set to false by the FileMan if there's an error

    std::string dir;

    FileMan(std::string rdir, bool create); // construct the FileMan to manage the directory referenced by rdir, creating it if asked

    FileWriteOutput create(std::string where); // create a file under this directory, parents and all

    MapView open(std::string thing); // memory map a file into the buffer-like MapView, returning an invalid
    // mapview if it doesn't exist (you MUST always check if mapview.isValid()!)
    // open() recycles MapViews, so rendering the same file twice doesn't map it twice.
};
