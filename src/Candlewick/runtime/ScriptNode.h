#pragma once

//project headers:
#include "ScriptValue.h"

//system headers:
#include <memory>

//forward declarations:
class Runtime;

//a node of a parsed script; the runtime only ever asks a node for its value
//nodes are immutable once built and may be evaluated any number of times, by any number of runtimes
class ScriptNode
{
public:
	virtual ~ScriptNode()
	{	}

	virtual ScriptValue Evaluate(Runtime &runtime) const = 0;
};

using ScriptNodePtr = std::shared_ptr<const ScriptNode>;
