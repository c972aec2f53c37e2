#pragma once

#include <node.hpp>
#include <vector>
#include <string>
#include <weavewriter.hpp>


struct Document : Node { // a document is a flat list of prose and chunks. Chunks run in order when the document is rendered, and
    // since they all share the Session's interpreter, a chunk sees everything the chunks before it (in this document and any rendered
    // earlier) left behind.
    std::vector<Node*> children;
    std::string name; // input path
    std::string outputPath; // full path of the rendered file; figures go next to it
    int unnamedChunks = 0;
    bool failed = false; // a chunk hit a fatal error; nothing after it gets rendered

    Document(Session* session);

    ~Document();

    void render(WeaveWriter* out);

    void addChild(Node* child);

    std::string figurePrefix(); // <output dir>/figure/<document stem>

    std::string relativeToOutput(std::string path); // for links from the rendered document to its figures
};
