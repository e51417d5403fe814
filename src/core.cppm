/// clustermc.core: core module aggregate
/// One import brings in:
///   error / buffer / address / socket / net_init (ensure_network) / log / dns
///
/// clustermc.core.ssl is imported separately (guarded by CLUSTERMC_HAS_SSL)

export module clustermc.core;

export import clustermc.core.error;
export import clustermc.core.buffer;
export import clustermc.core.address;
export import clustermc.core.socket;
export import clustermc.core.net_init;
export import clustermc.core.log;
export import clustermc.core.dns;
