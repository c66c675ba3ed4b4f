#ifndef FAKERENDERER_H
#define FAKERENDERER_H

#include "document/renderpauseguard.h"

// Records pause/resume calls
class FakeRenderer : public BackgroundRenderer
{
public:
    void stop() override { ++stops; }
    void resume() override { ++resumes; }

    int stops{0};
    int resumes{0};
};

#endif // FAKERENDERER_H
