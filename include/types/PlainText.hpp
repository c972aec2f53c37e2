#pragma once

#include <node.hpp>
#include <mapview.hpp>
#include <weavewriter.hpp>
#include <defs.h>


struct PlainText : Node { // prose between chunks, passed through untouched straight out of the memory map
    MapView data;

    PlainText(Session*, MapView d);

    void render(WeaveWriter* stream);
};
