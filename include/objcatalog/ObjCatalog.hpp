#pragma once
#include "core/Error.hpp"
#include "dependency/DependencyPath.hpp"
#include "dependency/DependencySource.hpp"
#include "field/ExtractOptions.hpp"
#include "field/Field.hpp"
#include "field/FieldNode.hpp"
#include "field/FieldNotifier.hpp"
#include "field/FieldValue.hpp"
#include "field/InvalidationScope.hpp"
#include "log/TaggedLogger.hpp"
#include "node/Catalog.hpp"
#include "node/Node.hpp"
#include "node/Traversal.hpp"
#include "schema/FieldSchema.hpp"
#include "schema/StructuredFieldNode.hpp"
#include "serialization/Snapshot.hpp"
#include "source/Bibliographic.hpp"
#include "source/Source.hpp"
#include "tools/GraphExport.hpp"
#include "type/TypeConstraint.hpp"
#include "type/Value.hpp"
#include "type/ValueConverters.hpp"
