#pragma once

#include "Assert.h"
#include "BinarySerializer.h"
#include "DummySerializer.h"
#include "Event.h"
#include "Expected.h"
#include "Export.h"
#include "Flags.h"
#include "GzipCodec.h"
#include "IStateSave.h"
#include "IStateSync.h"
#include "Invoker.h"
#include "Log.h"
#include "Math.h"
#include "SceneHost.h"
#include "Serializer.h"
#include "Settings.h"
#include "StateComponent.h"
#include "StateSaveEvents.h"
#include "StateSaveImplementer.h"
#include "StateSaveOrchestrator.h"
#include "StateSaveRegistry.h"
#include "StateSaveTypes.h"
#include "StateSyncDispatcher.h"
#include "StateSyncRuntime.h"
#include "SyncEvent.h"
#include "SyncMethodTable.h"
#include "TypeName.h"
#include "UniqueId.h"
#include "UniqueIdRegistry.h"
#include "Uuid.h"
#include "Variant.h"
#include "VariantCodec.h"
