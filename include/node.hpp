#pragma once
#include <cstddef>
#include <weavewriter.hpp>

struct Document; // forward-declarations
struct Session;

struct Node { // superclass
    virtual ~Node() {}

    Document* parent = NULL; // every node lives in a Document
    Session* session;
    int line = 0; // line of the input file this node starts on

    Node(Session* s) {
        session = s;
    }

    virtual void render(WeaveWriter* stream) = 0; // true virtual function
};
