#pragma once

namespace ent::tools {

class ToolRouter;

class ToolModule {
public:
    virtual ~ToolModule() = default;
    virtual void register_tools(ToolRouter& router) = 0;
};

} // namespace ent::tools
