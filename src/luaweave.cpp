/* luaweave

    Renders Lua-flavored Markdown. Every ```{lua} chunk in every .lmd file under the input directory runs, in order, in one shared LuaJIT
    session, and the rendered .md gets the chunk's source interleaved with whatever it printed and plotted. Everything else in the input
    directory is copied through untouched.
*/

#include <defs.h>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <limits.h>
#include <fts.h>
#include <sys/types.h>
#include <string>
#include <vector>
#include <session.hpp>
#include <render.hpp>


static std::string realPath(std::string path) { // "" if it doesn't exist (yet)
    char buffer[PATH_MAX];
    if (realpath(path.c_str(), buffer) == NULL) {
        return "";
    }
    return buffer;
}


int main(int argc, char** argv) {
    printf("\033[1mluaweave v1.0\033[0m\n");
    std::string outputDir = "output";
    std::string inputDir = ".";
    std::string standalone = "";
    std::vector<ConfigEntry> config;
    bool hasSpecificInputDir = false;
    bool wasConf = false;
    for (int i = 1; i < argc; i ++) {
        if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            i ++;
            outputDir = argv[i];
            wasConf = false;
        }
        else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            i ++;
            config.push_back(ConfigEntry{
                argv[i],
                "" });
            wasConf = true;
        }
        else if (strcmp(argv[i], "-i") == 0 && i + 1 < argc) {
            i ++;
            standalone = argv[i];
            wasConf = false;
        }
        else if (wasConf) {
            config[config.size() - 1].content = argv[i];
            wasConf = false;
        }
        else if (!hasSpecificInputDir) {
            hasSpecificInputDir = true;
            inputDir = argv[i];
        }
        else {
            printf(ERROR "Unexpected argument %s\n", argv[i]);
        }
    }

    if (standalone != "") {
        Session session("", outputDir); // figures still go to the output directory
        session.config = config;
        session.inDocumentBuild = false;
        return runStandalone(standalone, &session) ? 0 : 1;
    }

    Session session(inputDir, outputDir);
    session.config = config;
    if (!session.input.valid || !session.output.valid) {
        printf("Abort.\n");
        return 1;
    }
    printf(INFO "Rendering project '%s' to '%s'.\n", inputDir.c_str(), outputDir.c_str());

    std::string outputReal = realPath(outputDir);
    char* paths[] = { (char*)inputDir.c_str(), NULL }; // for FTS
    FTS* ftsp = fts_open(paths, FTS_PHYSICAL | FTS_NOCHDIR, NULL);
    if (ftsp == NULL) {
        printf(ERROR "Couldn't initiate directory traversal.\n");
        perror("\tfts_open");
        return 1;
    }
    int failures = 0;
    FTSENT* ent;
    while ((ent = fts_read(ftsp)) != NULL) {
        if (ent -> fts_info == FTS_D && outputReal != "" && realPath(ent -> fts_path) == outputReal) {
            fts_set(ftsp, ent, FTS_SKIP); // don't render our own output
        }
        else if (ent -> fts_info == FTS_F) {
            if (!renderFile(ent -> fts_path, &session)) {
                failures ++;
            }
        }
    }
    fts_close(ftsp);

    if (failures > 0) {
        printf("\033[1;31mBuild finished with %d failed document%s.\033[0m\n", failures, failures == 1 ? "" : "s");
        return 1;
    }
    printf("\033[1;33mBuild complete!\033[0m\n");
    return 0;
}
