// definitions for FileMan

#include <fileman.hpp>
#include <sys/stat.h>
#include <fcntl.h>
#include <cstdio>


FileWriteOutput createFile(std::string name) {
    if (!mkdirR(name)) {
        return FileWriteOutput(-1);
    }
    int output = ::open(name.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (output == -1) {
        printf(ERROR "Couldn't open output file %s.\n", name.c_str());
        perror("\topen");
    }
    return FileWriteOutput(output);
}


FileMan::FileMan(std::string rdir, bool create) {
    dir = rdir.size() == 0 ? "." : rdir;
    struct stat sb;
    if (stat(dir.c_str(), &sb) == 0) {
        if (!S_ISDIR(sb.st_mode)) { // if the "folder" exists but is a regular file
            printf(ERROR "%s already exists and is not a directory. Fatal.\n", dir.c_str());
            valid = false;
        }
    }
    else if (create) {
        if (!mkdirR(fconcat(dir, "")) || mkdir(dir.c_str(), 0755) != 0) {
            printf(ERROR "Couldn't create directory %s.\n", dir.c_str());
            valid = false;
        }
    }
    else {
        printf(ERROR "%s does not exist.\n", dir.c_str());
        valid = false;
    }
}

FileWriteOutput FileMan::create(std::string name) {
    return createFile(transmuted(name));
}

MapView FileMan::open(std::string name) {
    if (!maps.contains(name)) {
        MapView m(name);
        if (!m.isValid()) {
            return m;
        }
        maps.insert({ name, m });
    }
    return maps.at(name);
}

std::string FileMan::transmuted(std::string path) {
    return fconcat(dir, path);
}

std::string FileMan::arcTransmuted(std::string path) {
    if (path.size() <= dir.size() || path.compare(0, dir.size(), dir) != 0) {
        return path;
    }
    return path.substr(dir.size() + (dir[dir.size() - 1] == '/' ? 0 : 1));
}
